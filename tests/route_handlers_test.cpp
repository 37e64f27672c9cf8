#include <gtest/gtest.h>
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>

class RouteHandlersTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        PocoConfigManager::getInstance().initializeDefaultConfig();
    }
};

TEST_F(RouteHandlersTest, HealthReportsOk)
{
    httplib::Request req;
    httplib::Response res;

    RouteHandlers::handleHealth(req, res);

    EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
    EXPECT_EQ(json::parse(res.body), json({{"status", "ok"}}));
}

TEST_F(RouteHandlersTest, ExtractWithoutFileIsBadRequest)
{
    httplib::Request req;
    httplib::Response res;

    RouteHandlers::handleExtract(req, res);

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(json::parse(res.body)["detail"], "No file uploaded.");
}

TEST_F(RouteHandlersTest, RoutesRegisterOnServer)
{
    httplib::Server svr;
    EXPECT_NO_THROW(RouteHandlers::setupRoutes(svr));
}

class ExtractEndpointTest : public RouteHandlersTest
{
protected:
    static httplib::Request upload(const std::string &filename, const std::string &content)
    {
        httplib::Request req;
        httplib::MultipartFormData part;
        part.name = "file";
        part.filename = filename;
        part.content = content;
        part.content_type = "application/octet-stream";
        req.files.emplace("file", part);
        return req;
    }

    static std::string pngBytes(int width, int height)
    {
        cv::Mat pixels(height, width, CV_8UC3, cv::Scalar(30, 160, 90));
        std::vector<uint8_t> encoded;
        EXPECT_TRUE(cv::imencode(".png", pixels, encoded));
        return std::string(encoded.begin(), encoded.end());
    }
};

TEST_F(ExtractEndpointTest, UnsupportedExtensionIsBadRequest)
{
    httplib::Request req = upload("animation.gif", pngBytes(8, 8));
    httplib::Response res;

    RouteHandlers::handleExtract(req, res);

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(json::parse(res.body)["detail"], "Unsupported file type.");
}

TEST_F(ExtractEndpointTest, OversizedUploadIsRejected)
{
    PocoConfigManager::getInstance().update(json{{"upload", {{"max_bytes", 64}}}});
    httplib::Request req = upload("big.png", std::string(65, 'x'));
    httplib::Response res;

    RouteHandlers::handleExtract(req, res);

    EXPECT_EQ(res.status, 413);
    EXPECT_EQ(json::parse(res.body)["detail"], "File too large.");
}

TEST_F(ExtractEndpointTest, UndecodableImageIsUnprocessable)
{
    httplib::Request req = upload("broken.jpg", std::string(256, 'Z'));
    httplib::Response res;

    RouteHandlers::handleExtract(req, res);

    EXPECT_EQ(res.status, 422);
    const std::string detail = json::parse(res.body)["detail"];
    EXPECT_NE(detail.find("broken.jpg"), std::string::npos) << detail;
}

TEST_F(ExtractEndpointTest, SuccessfulUploadReturnsRecord)
{
    httplib::Request req = upload("swatch.png", pngBytes(40, 30));
    httplib::Response res;

    RouteHandlers::handleExtract(req, res);

    ASSERT_EQ(res.status, 200);
    EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
    json record = json::parse(res.body);
    EXPECT_EQ(record["filename"], "swatch.png");
    EXPECT_EQ(record["format"], "PNG");
    EXPECT_EQ(record["size"], json::array({40, 30}));
    EXPECT_TRUE(record["errors"].is_object());
    EXPECT_TRUE(record["errors"].empty());
    EXPECT_TRUE(record["exif"].is_null());
    EXPECT_EQ(record["sha256"].get<std::string>().size(), 64u);
}

TEST_F(ExtractEndpointTest, NonUtf8UploadNameStillProducesJson)
{
    httplib::Request req = upload(std::string("r") + '\xE9' + "sum" + '\xE9' + ".png", pngBytes(8, 6));
    httplib::Response res;

    RouteHandlers::handleExtract(req, res);

    ASSERT_EQ(res.status, 200);
    json record = json::parse(res.body);
    EXPECT_EQ(record["filename"], "r\xEF\xBF\xBDsum\xEF\xBF\xBD.png");
}
