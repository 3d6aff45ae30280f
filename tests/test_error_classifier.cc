#include <array>
#include <core/transfer/error_classifier.h>
#include <gtest/gtest.h>

using namespace bucketpull::core;

TEST(ErrorClassifierTest, ZeroExitIsNoError) {
    EXPECT_EQ(ClassifyError(0, ""), ErrorKind::kNone);
    // output text does not matter once the tool reported success
    EXPECT_EQ(ClassifyError(0, "AccessDeniedException: 403"), ErrorKind::kNone);
}

TEST(ErrorClassifierTest, TerminatedIsCancelled) {
    EXPECT_EQ(ClassifyError(-1, "", true), ErrorKind::kCancelled);
    EXPECT_EQ(ClassifyError(0, "", true), ErrorKind::kCancelled);
    EXPECT_EQ(ClassifyError(1, "No URLs matched", true), ErrorKind::kCancelled);
}

TEST(ErrorClassifierTest, NotFound) {
    EXPECT_EQ(ClassifyError(1, "CommandException: No URLs matched: gs://bucket/missing.txt"),
              ErrorKind::kBucketOrPathNotFound);
    EXPECT_EQ(ClassifyError(1, "BucketNotFoundException: 404 gs://nope bucket does not exist."),
              ErrorKind::kBucketOrPathNotFound);
}

TEST(ErrorClassifierTest, PermissionDenied) {
    EXPECT_EQ(ClassifyError(1,
                            "AccessDeniedException: 403 me@example.com does not have "
                            "storage.objects.list access to the Google Cloud Storage bucket."),
              ErrorKind::kPermissionDenied);
    EXPECT_EQ(ClassifyError(1, "ServiceException: 401 Anonymous caller does not have access"),
              ErrorKind::kPermissionDenied);
}

TEST(ErrorClassifierTest, LocalPermissionDeniedIsDestinationUnwritable) {
    EXPECT_EQ(ClassifyError(1, "OSError: [Errno 13] Permission denied: '/data/dl/a.txt'"),
              ErrorKind::kDestinationUnwritable);
    EXPECT_EQ(ClassifyError(1, "OSError: [Errno 28] No space left on device"),
              ErrorKind::kDestinationUnwritable);
    EXPECT_EQ(ClassifyError(1, "Cannot create destination directory /ro: Read-only file system"),
              ErrorKind::kDestinationUnwritable);
}

TEST(ErrorClassifierTest, NetworkFailure) {
    EXPECT_EQ(ClassifyError(1, "ConnectionResetError: [Errno 104] Connection reset by peer"),
              ErrorKind::kNetworkFailure);
    EXPECT_EQ(ClassifyError(1, "socket.timeout: The read operation timed out"),
              ErrorKind::kNetworkFailure);
    EXPECT_EQ(ClassifyError(1, "Temporary failure in name resolution"),
              ErrorKind::kNetworkFailure);
}

TEST(ErrorClassifierTest, MatchingIsCaseInsensitive) {
    EXPECT_EQ(ClassifyError(1, "NO URLS MATCHED"), ErrorKind::kBucketOrPathNotFound);
}

TEST(ErrorClassifierTest, UnmatchedFailureIsUnknown) {
    EXPECT_EQ(ClassifyError(1, ""), ErrorKind::kUnknown);
    EXPECT_EQ(ClassifyError(3, "Something unexpected happened"), ErrorKind::kUnknown);
}

TEST(ErrorClassifierTest, CustomTableFirstMatchWins) {
    constexpr std::array<ErrorPattern, 2> patterns{{
        {ErrorKind::kNetworkFailure, "flaky"},
        {ErrorKind::kPermissionDenied, "flaky permission"},
    }};
    EXPECT_EQ(ClassifyError(1, "a flaky permission problem", false, patterns),
              ErrorKind::kNetworkFailure);
    EXPECT_EQ(ClassifyError(1, "No URLs matched", false, patterns), ErrorKind::kUnknown);
}

TEST(ErrorClassifierTest, DefaultTableNeverYieldsNoneOrCancelled) {
    for (const auto& pattern : DefaultErrorPatterns()) {
        EXPECT_NE(pattern.kind, ErrorKind::kNone) << pattern.needle;
        EXPECT_NE(pattern.kind, ErrorKind::kCancelled) << pattern.needle;
        EXPECT_FALSE(pattern.needle.empty());
    }
}
