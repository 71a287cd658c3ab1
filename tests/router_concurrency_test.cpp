#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

#include "arbor/http-method.hpp"
#include "arbor/http-request.hpp"
#include "arbor/http-response.hpp"
#include "arbor/http-status-code.hpp"
#include "arbor/router-config.hpp"
#include "arbor/router.hpp"
#include "arbor/vector.hpp"

using namespace arbor;

namespace {

constexpr int kNbReaders = 4;
constexpr int kNbRegistrations = 500;

}  // namespace

TEST(RouterConcurrency, RegisterWhileMatching) {
  Router router;
  router.onGet("/hot/:id", [](const HttpRequest &) { return HttpResponse("v0"); });

  std::atomic<bool> writerDone{false};
  std::atomic<std::size_t> nbBadResponses{0};

  vector<std::thread> readers;
  for (int readerIdx = 0; readerIdx < kNbReaders; ++readerIdx) {
    readers.emplace_back([&router, &writerDone, &nbBadResponses] {
      PathParams params;
      while (!writerDone.load(std::memory_order_acquire)) {
        params.clear();
        auto res = router.match(http::Method::GET, "/hot/42", params);
        if (!res.handler || params.size() != 1U || params.begin()->second != "42") {
          nbBadResponses.fetch_add(1, std::memory_order_relaxed);
          continue;
        }
        // The handler stays valid even if it is replaced meanwhile
        HttpResponse resp = (*res.handler)(HttpRequest("GET", "/hot/42"));
        if (resp.status() != http::StatusCodeOK || resp.body().empty() || resp.body().front() != 'v') {
          nbBadResponses.fetch_add(1, std::memory_order_relaxed);
        }

        HttpRequest req("GET", "/cold/7");
        const auto status = router.serve(req).status();
        if (status != http::StatusCodeOK && status != http::StatusCodeNotFound) {
          nbBadResponses.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }

  std::thread writer([&router, &writerDone] {
    for (int idx = 0; idx < kNbRegistrations; ++idx) {
      std::string body = "v" + std::to_string(idx + 1);
      router.onGet("/hot/:id", [body](const HttpRequest &) { return HttpResponse(body); });
      router.onPost("/hot/" + std::to_string(idx), [](const HttpRequest &) { return HttpResponse("p"); });
      if (idx == kNbRegistrations / 2) {
        router.onGet("/cold/:id", [](const HttpRequest &) { return HttpResponse("cold"); });
      }
    }
    writerDone.store(true, std::memory_order_release);
  });

  writer.join();
  for (auto &reader : readers) {
    reader.join();
  }

  EXPECT_EQ(nbBadResponses.load(), 0U);

  PathParams params;
  auto res = router.match(http::Method::GET, "/hot/1", params);
  ASSERT_NE(res.handler, nullptr);
  EXPECT_EQ((*res.handler)(HttpRequest("GET", "/hot/1")).body(), "v" + std::to_string(kNbRegistrations));
  EXPECT_NE(router.match(http::Method::POST, "/hot/" + std::to_string(kNbRegistrations - 1), params).handler,
            nullptr);
  EXPECT_NE(router.match(http::Method::GET, "/cold/1", params).handler, nullptr);
}

TEST(RouterConcurrency, ConcurrentMatchingWithoutLock) {
  Router router(RouterConfig{}.withConcurrentRegistration(false));
  // All registrations happen before the readers start
  for (int idx = 0; idx < 100; ++idx) {
    router.onGet("/items/" + std::to_string(idx) + "/:name", [](const HttpRequest &req) {
      return HttpResponse(req.pathParam("name").value_or(""));
    });
  }

  std::atomic<std::size_t> nbErrors{0};
  vector<std::thread> readers;
  for (int readerIdx = 0; readerIdx < kNbReaders; ++readerIdx) {
    readers.emplace_back([&router, &nbErrors, readerIdx] {
      for (int idx = 0; idx < 1000; ++idx) {
        const std::string name = "n" + std::to_string(readerIdx);
        const std::string path = "/items/" + std::to_string(idx % 100) + "/" + name;
        HttpRequest req("GET", path);
        HttpResponse resp = router.serve(req);
        if (resp.status() != http::StatusCodeOK || resp.body() != name) {
          nbErrors.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }
  for (auto &reader : readers) {
    reader.join();
  }
  EXPECT_EQ(nbErrors.load(), 0U);
}
