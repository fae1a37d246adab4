#include "core/errors.h"

#include <gtest/gtest.h>
#include <string>

using rtsub::RemoteServiceError;

TEST(ErrorsTest, RemoteServiceErrorCarriesKindAndStatus) {
    RemoteServiceError err(RemoteServiceError::Kind::HttpStatus, "server said no", 503);
    EXPECT_EQ(err.kind(), RemoteServiceError::Kind::HttpStatus);
    EXPECT_EQ(err.httpStatus(), 503);
    EXPECT_FALSE(err.isTimeout());
    EXPECT_STREQ(err.what(), "server said no");
}

TEST(ErrorsTest, TimeoutIsRecognisedWithoutMessageInspection) {
    RemoteServiceError err(RemoteServiceError::Kind::Timeout, "");
    EXPECT_TRUE(err.isTimeout());
    EXPECT_EQ(err.httpStatus(), 0);
}

TEST(ErrorsTest, KindNames) {
    EXPECT_STREQ(rtsub::remoteErrorKindToString(RemoteServiceError::Kind::Timeout), "timeout");
    EXPECT_STREQ(rtsub::remoteErrorKindToString(RemoteServiceError::Kind::HttpStatus),
                 "http_status");
    EXPECT_STREQ(rtsub::remoteErrorKindToString(RemoteServiceError::Kind::Transport), "transport");
    EXPECT_STREQ(rtsub::remoteErrorKindToString(RemoteServiceError::Kind::Protocol), "protocol");
}

TEST(ErrorsTest, AllErrorsAreRuntimeErrors) {
    try {
        throw rtsub::DeviceError("no device");
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "no device");
    }
    EXPECT_THROW(throw rtsub::InferenceError("x"), std::runtime_error);
    EXPECT_THROW(throw rtsub::ConfigError("x"), std::runtime_error);
}
