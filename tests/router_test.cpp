#include "minihttp/router.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "minihttp/request.hpp"
#include "minihttp/response.hpp"
#include "minihttp/status.hpp"

namespace minihttp {

namespace {

// Replies 200 with the segments joined by '|'
class RecordingHandler : public RequestHandler {
 public:
  HTTP_Response handle([[maybe_unused]] const HTTP_Request &request, const Segments &segments) const override {
    std::string joined;
    for (const auto &segment : segments) {
      if (!joined.empty()) {
        joined += '|';
      }
      joined += segment;
    }
    return make_response(HTTP_STATUS_CODE::OK, joined, "text/plain");
  }
};

class ThrowingHandler : public RequestHandler {
 public:
  HTTP_Response handle(const HTTP_Request &, const Segments &) const override {
    throw std::runtime_error("secret detail /etc/passwd");
  }
};

HTTP_Request makeRequest(const std::string &path, const std::string &method = "GET") {
  HTTP_Request req;
  req.method = method;
  req.path = path;
  req.version = "HTTP/1.1";
  return req;
}

}  // namespace

class RouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    router.add_route("echo", std::make_unique<RecordingHandler>());
    router.add_route("boom", std::make_unique<ThrowingHandler>());
  }

  Router router;
};

TEST_F(RouterTest, RootAnswersBareOk) {
  for (const char *path : {"/", ""}) {
    HTTP_Response resp = router.dispatch(makeRequest(path));
    EXPECT_EQ(resp.status_code, 200) << path;
    EXPECT_TRUE(resp.body.empty());
    EXPECT_TRUE(resp.headers.empty());
  }
}

TEST_F(RouterTest, DispatchesOnFirstSegment) {
  HTTP_Response resp = router.dispatch(makeRequest("/echo/abc"));
  EXPECT_EQ(resp.status_code, 200);
  EXPECT_EQ(resp.body, "echo|abc");
}

TEST_F(RouterTest, MethodDoesNotAffectLookup) {
  EXPECT_EQ(router.dispatch(makeRequest("/echo/x", "DELETE")).status_code, 200);
}

TEST_F(RouterTest, UnknownSegmentIsNotFound) {
  EXPECT_EQ(router.dispatch(makeRequest("/unknown/path")).status_code, 404);
  EXPECT_EQ(router.dispatch(makeRequest("/ECHO/abc")).status_code, 404);
  EXPECT_EQ(router.dispatch(makeRequest("/echoes")).status_code, 404);
}

TEST_F(RouterTest, PathWithoutSegmentsIsNotFound) {
  EXPECT_EQ(router.dispatch(makeRequest("//")).status_code, 404);
  EXPECT_EQ(router.dispatch(makeRequest("///")).status_code, 404);
}

TEST_F(RouterTest, EmptyInteriorSegmentIsSkippedNotEchoedAsEmptyText) {
  HTTP_Response resp = router.dispatch(makeRequest("//echo//abc/"));
  EXPECT_EQ(resp.status_code, 200);
  EXPECT_EQ(resp.body, "echo|abc");
}

TEST_F(RouterTest, HandlerExceptionBecomesInternalErrorWithoutDetail) {
  HTTP_Response resp = router.dispatch(makeRequest("/boom"));
  EXPECT_EQ(resp.status_code, 500);
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(resp.to_string().find("passwd"), std::string::npos);
}

TEST_F(RouterTest, LaterRegistrationReplacesEarlier) {
  router.add_route("echo", std::make_unique<ThrowingHandler>());
  EXPECT_EQ(router.dispatch(makeRequest("/echo/x")).status_code, 500);
}

TEST(RouterSplitPath, DropsEmptySegments) {
  EXPECT_EQ(Router::split_path("/files/a.txt"), (Segments{"files", "a.txt"}));
  EXPECT_EQ(Router::split_path("/a//b/"), (Segments{"a", "b"}));
  EXPECT_EQ(Router::split_path("relative"), (Segments{"relative"}));
  EXPECT_TRUE(Router::split_path("/").empty());
  EXPECT_TRUE(Router::split_path("").empty());
}

}  // namespace minihttp
