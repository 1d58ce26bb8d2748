#include <gtest/gtest.h>
#include <sstream>
#include "GeoHashHandler.hpp"

class GeoHashHandlerTest : public ::testing::Test {
protected:
    std::string run(const std::string& message, const HandlerConfig& config = HandlerConfig()) {
        std::ostringstream out;
        GeoHashHandler handler(out, config);
        handler.handleMessage(message);
        return out.str();
    }

    static bool isError(const std::string& reply) {
        return reply.rfind("-ERR", 0) == 0;
    }
};

TEST_F(GeoHashHandlerTest, Ping) {
    EXPECT_EQ(run("PING"), "+PONG\r\n");
    EXPECT_EQ(run("ping hello"), "$5\r\nhello\r\n");
}

TEST_F(GeoHashHandlerTest, EncodeWithExplicitTolerance) {
    EXPECT_EQ(run("ENCODE 42.6 -5.6 0.1"), "$5\r\nezs42\r\n");
    EXPECT_EQ(run("ENCODE 57.64911 10.40744 0.01 1.0"), "$6\r\nu4pruy\r\n");
}

TEST_F(GeoHashHandlerTest, EncodeUsesConfiguredTolerance) {
    HandlerConfig config;
    config.latTolerance = 0.1;
    config.lonTolerance = 0.1;
    EXPECT_EQ(run("ENCODE 42.6 -5.6", config), "$5\r\nezs42\r\n");
}

TEST_F(GeoHashHandlerTest, EncodeOverResp) {
    EXPECT_EQ(run("*4\r\n$6\r\nENCODE\r\n$4\r\n42.6\r\n$4\r\n-5.6\r\n$3\r\n0.1\r\n"), "$5\r\nezs42\r\n");
}

TEST_F(GeoHashHandlerTest, EncodeArgumentErrors) {
    EXPECT_TRUE(isError(run("ENCODE 42.6")));
    EXPECT_TRUE(isError(run("ENCODE 1 2 3 4 5")));
    EXPECT_EQ(run("ENCODE north 2"), "-ERR value is not a valid float\r\n");
    EXPECT_EQ(run("ENCODE 1 2 0"), "-ERR tolerance must be positive\r\n");
}

TEST_F(GeoHashHandlerTest, EncodeFloorsUnderflowingTolerance) {
    std::string floored = run("ENCODE 1 2 0.00000001");
    EXPECT_EQ(run("ENCODE 1 2 1e-400"), floored);
    EXPECT_EQ(run("ENCODE 1 2 1e-400 1e-400"), floored);
    EXPECT_EQ(run("ENCODE 1 2 -1e-400"), "-ERR tolerance must be positive\r\n");
    EXPECT_EQ(run("ENCODE 1 2 nan"), "-ERR tolerance must be positive\r\n");
    EXPECT_EQ(run("ENCODE 1 2 0.1x"), "-ERR value is not a valid float\r\n");
}

TEST_F(GeoHashHandlerTest, Decode) {
    EXPECT_EQ(run("DECODE u"),
              "*4\r\n$2\r\n45\r\n$4\r\n22.5\r\n$1\r\n0\r\n$4\r\n22.5\r\n");
}

TEST_F(GeoHashHandlerTest, DecodeRejectsInvalidHash) {
    std::string reply = run("DECODE abc!");
    EXPECT_TRUE(isError(reply));
    EXPECT_NE(reply.find("illegal character"), std::string::npos);
}

TEST_F(GeoHashHandlerTest, Neighbor) {
    EXPECT_EQ(run("NEIGHBOR ezs42 west"), "$5\r\nezefr\r\n");
    EXPECT_EQ(run("NEIGHBOR gbsuv N"), "$5\r\ngbsvj\r\n");
    EXPECT_EQ(run("NEIGHBOR gbsuv up"), "-ERR unknown direction 'up'\r\n");
    EXPECT_TRUE(isError(run("NEIGHBOR gbsuv")));
    EXPECT_TRUE(isError(run("NEIGHBOR gbsul E")));
}

TEST_F(GeoHashHandlerTest, Neighbors) {
    EXPECT_EQ(run("NEIGHBORS gbsuv"),
              "*4\r\n$5\r\ngbsvj\r\n$5\r\ngbsuy\r\n$5\r\ngbsut\r\n$5\r\ngbsuu\r\n");
}

TEST_F(GeoHashHandlerTest, Validate) {
    EXPECT_EQ(run("VALIDATE u4pruydqqvj"), ":1\r\n");
    EXPECT_EQ(run("VALIDATE abc!"), ":0\r\n");
}

TEST_F(GeoHashHandlerTest, UnknownAndEmptyCommands) {
    EXPECT_EQ(run("SET key value"), "-ERR unknown command 'SET'\r\n");
    EXPECT_EQ(run(""), "-ERR Empty command\r\n");
}
