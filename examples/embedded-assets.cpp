/// @file embedded-assets.cpp
/// @brief Serve assets compiled into the binary, with pre-compressed variants, behind an API handler.
///
/// Run:
///   ./build/examples/ember-embedded-assets [METHOD] [path] [accept-encoding]
///
/// Examples:
///   ./build/examples/ember-embedded-assets GET /assets/app.js "gzip, br"
///   ./build/examples/ember-embedded-assets HEAD /assets/
///   ./build/examples/ember-embedded-assets GET /api/version

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ember/embedded-asset-config.hpp"
#include "ember/embedded-asset-handler.hpp"
#include "ember/handler-chain.hpp"
#include "ember/handler-outcome.hpp"
#include "ember/http-constants.hpp"
#include "ember/http-method.hpp"
#include "ember/http-request.hpp"
#include "ember/http-response.hpp"
#include "ember/log.hpp"
#include "ember/memory-asset-store.hpp"
#include "ember/version.hpp"

namespace {

// Usually produced by a build step embedding a directory of web assets.
constexpr std::string_view kIndexHtml =
    "<!doctype html>\n<html><head><link rel=\"stylesheet\" href=\"style.css\"></head>"
    "<body><script src=\"app.js\"></script></body></html>\n";
constexpr std::string_view kStyleCss = "body { font-family: sans-serif; }\n";
constexpr std::string_view kAppJs = "document.body.append('hello from embedded assets');\n";
constexpr std::string_view kAppJsGz = "\x1f\x8b\x08<gzip stream>";
constexpr std::string_view kAppJsBr = "<brotli stream>";

}  // namespace

int main(int argc, char** argv) {
  ember::http::Method method = ember::http::Method::GET;
  std::string path = "/assets/";
  if (argc > 1) {
    const auto optMethod = ember::http::MethodStrToOpt(argv[1]);
    if (!optMethod) {
      std::cerr << "Invalid method: " << argv[1] << '\n';
      return EXIT_FAILURE;
    }
    method = *optMethod;
  }
  if (argc > 2) {
    path = argv[2];
  }

  ember::log::set_level(ember::log::level::debug);

  try {
    auto store = std::make_shared<ember::MemoryAssetStore>();
    store->addStatic("index.html", kIndexHtml)
        .addStatic("style.css", kStyleCss)
        .addStatic("app.js", kAppJs)
        .addStatic("app.js.gz", kAppJsGz)
        .addStatic("app.js.br", kAppJsBr);

    ember::EmbeddedAssetConfig assetCfg;
    assetCfg.withMountPath("/assets/").withCacheControl("public, max-age=3600");

    ember::HandlerChain chain;
    chain.add(ember::EmbeddedAssetHandler(std::move(store), std::move(assetCfg)))
        .add([](const ember::HttpRequest& request) {
          if (request.path() != "/api/version") {
            return ember::HandlerOutcome::Declined();
          }
          ember::HttpResponse resp;
          resp.body(std::string(ember::fullVersionStringView()) + '\n', ember::http::ContentTypeTextPlain);
          return ember::HandlerOutcome::Served(std::move(resp));
        });

    ember::HttpRequest request(method, std::move(path));
    if (argc > 3) {
      request.addHeader(ember::http::AcceptEncoding, argv[3]);
    }

    const ember::HttpResponse resp = chain.handle(request);
    std::cout << resp.status() << ' ' << resp.reason() << '\n';
    for (const auto& [name, value] : resp.headers()) {
      std::cout << name << ": " << value << '\n';
    }
    std::cout << '\n' << resp.body();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
