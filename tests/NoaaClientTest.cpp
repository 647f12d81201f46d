#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "NoaaClient.h"
#include "TestSupport.h"

static float flatFour(int)
{
    return 4.0f;
}

static bool isSortedUnique(const TideRawSamples& raw)
{
    for (size_t i = 1; i < raw.size(); ++i) {
        if (raw[i].timeUtc <= raw[i - 1].timeUtc) return false;
    }
    return true;
}

TEST(NoaaClientUrl, CarriesStationWindowAndFixedParameters)
{
    const std::string url = NoaaClient::buildRequestUrl("8418150", TEST_NOW, 12);

    EXPECT_EQ(url.rfind("https://api.tidesandcurrents.noaa.gov/api/prod/datagetter?", 0), 0u);
    EXPECT_NE(url.find("product=predictions"), std::string::npos);
    EXPECT_NE(url.find("station=8418150"), std::string::npos);
    EXPECT_NE(url.find("datum=MLLW"), std::string::npos);
    EXPECT_NE(url.find("time_zone=gmt"), std::string::npos);
    EXPECT_NE(url.find("units=english"), std::string::npos);
    EXPECT_NE(url.find("interval=6"), std::string::npos);
    EXPECT_NE(url.find("format=json"), std::string::npos);
    EXPECT_NE(url.find("range=26"), std::string::npos);
    // now - 13 h = 2023-11-14 09:00 GMT
    EXPECT_NE(url.find("begin_date=20231114%2009:00"), std::string::npos);
}

TEST(NoaaClientParse, SixMinutePredictionsAreAccepted)
{
    const TideRawSamples raw = testRawSamples(TEST_NOW, -780, 780, 6, [](int m) {
        return 1.0f + static_cast<float>(m) / 1000.0f;
    });

    TideRawSamples out;
    ASSERT_EQ(NoaaClient::parsePredictions(testNoaaPayload(raw), TEST_NOW, out), FetchResult::Ok);
    ASSERT_EQ(out.size(), raw.size());
    EXPECT_TRUE(isSortedUnique(out));
    EXPECT_EQ(out.front().timeUtc, raw.front().timeUtc);
    EXPECT_NEAR(out.front().height, raw.front().height, 1e-3);
    EXPECT_NEAR(out.back().height, raw.back().height, 1e-3);
}

TEST(NoaaClientParse, ErrorBodyIsParseError)
{
    TideRawSamples out;
    const std::string body =
        "{\"error\": {\"message\": \"No Predictions data was found. Please make sure the Datum input is valid.\"}}";
    EXPECT_EQ(NoaaClient::parsePredictions(body, TEST_NOW, out), FetchResult::ParseError);
    EXPECT_TRUE(out.empty());
}

TEST(NoaaClientParse, MalformedOrEmptyDocumentIsParseError)
{
    TideRawSamples out;
    EXPECT_EQ(NoaaClient::parsePredictions("<html>502 Bad Gateway</html>", TEST_NOW, out),
              FetchResult::ParseError);
    EXPECT_EQ(NoaaClient::parsePredictions("{}", TEST_NOW, out), FetchResult::ParseError);
    EXPECT_EQ(NoaaClient::parsePredictions("{\"predictions\": 5}", TEST_NOW, out),
              FetchResult::ParseError);
}

TEST(NoaaClientParse, TwentyFourPointsIsInsufficient)
{
    const TideRawSamples raw = testRawSamples(TEST_NOW, -720, 660, 60, flatFour);
    ASSERT_EQ(raw.size(), 24u);

    TideRawSamples out;
    EXPECT_EQ(NoaaClient::parsePredictions(testNoaaPayload(raw), TEST_NOW, out),
              FetchResult::InsufficientData);
}

TEST(NoaaClientParse, TwentyFiveBracketingPointsAreEnough)
{
    const TideRawSamples raw = testRawSamples(TEST_NOW, -720, 720, 60, flatFour);
    ASSERT_EQ(raw.size(), 25u);

    TideRawSamples out;
    EXPECT_EQ(NoaaClient::parsePredictions(testNoaaPayload(raw), TEST_NOW, out), FetchResult::Ok);
}

TEST(NoaaClientParse, PointsNotBracketingWindowAreInsufficient)
{
    // Plenty of points, but they stop two hours short of the window end
    const TideRawSamples raw = testRawSamples(TEST_NOW, -780, 600, 6, flatFour);

    TideRawSamples out;
    EXPECT_EQ(NoaaClient::parsePredictions(testNoaaPayload(raw), TEST_NOW, out),
              FetchResult::InsufficientData);
}

TEST(NoaaClientParse, UnsortedAndDuplicatedEntriesAreNormalised)
{
    TideRawSamples raw = testRawSamples(TEST_NOW, -780, 780, 60, flatFour);
    const size_t distinct = raw.size();
    std::reverse(raw.begin(), raw.end());
    const TideRawSample dupA = raw[4];
    const TideRawSample dupB = raw[10];
    raw.push_back(dupA);
    raw.push_back(dupB);

    TideRawSamples out;
    ASSERT_EQ(NoaaClient::parsePredictions(testNoaaPayload(raw), TEST_NOW, out), FetchResult::Ok);
    EXPECT_EQ(out.size(), distinct);
    EXPECT_TRUE(isSortedUnique(out));
}

TEST(NoaaClientParse, BadEntriesAreSkipped)
{
    const TideRawSamples raw = testRawSamples(TEST_NOW, -780, 780, 60, flatFour);
    std::string body = testNoaaPayload(raw);

    // Splice broken entries in before the closing "]}"
    body.insert(body.size() - 2,
                ",{\"t\":\"yesterday\",\"v\":\"1.0\"}"
                ",{\"t\":\"2023-11-14 22:03\",\"v\":\"abc\"}"
                ",{\"t\":\"2023-11-14 22:04\",\"v\":\"\"}"
                ",{\"v\":\"1.0\"}"
                ",{\"t\":\"2023-13-40 22:00\",\"v\":\"1.0\"}");

    TideRawSamples out;
    ASSERT_EQ(NoaaClient::parsePredictions(body, TEST_NOW, out), FetchResult::Ok);
    EXPECT_EQ(out.size(), raw.size());
}

TEST(NoaaClientParse, TimestampsAreReadAsGmt)
{
    const std::string body =
        "{\"predictions\":[{\"t\":\"2023-11-14 22:00\",\"v\":\"5.125\"}]}";

    TideRawSamples out;
    // A lone point is rejected and out is left untouched
    EXPECT_EQ(NoaaClient::parsePredictions(body, TEST_NOW, out), FetchResult::InsufficientData);
    EXPECT_TRUE(out.empty());

    TideRawSamples raw = testRawSamples(TEST_NOW, -780, 780, 60, flatFour);
    raw[13].height = 5.125f;   // offset 0
    ASSERT_EQ(NoaaClient::parsePredictions(testNoaaPayload(raw), TEST_NOW, out), FetchResult::Ok);
    EXPECT_EQ(out[13].timeUtc, TEST_NOW);
    EXPECT_FLOAT_EQ(out[13].height, 5.125f);
}

TEST(FetchResultName, NamesEveryOutcome)
{
    EXPECT_STREQ(FetchResultName(FetchResult::Ok), "Ok");
    EXPECT_STREQ(FetchResultName(FetchResult::NetworkError), "NetworkError");
    EXPECT_STREQ(FetchResultName(FetchResult::ParseError), "ParseError");
    EXPECT_STREQ(FetchResultName(FetchResult::InsufficientData), "InsufficientData");
}
