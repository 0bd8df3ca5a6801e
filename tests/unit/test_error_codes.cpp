#include <gtest/gtest.h>
#include "ErrorCodes.h"
#include "Result.h"

using namespace SettleFS;

TEST(ErrorRegistryTest, MakeErrorCarriesCodeAndDetails) {
    auto error = Core::ErrorRegistry::makeError(Core::ErrorCode::WATCH_ADD_FAILED, "/tmp/x: Permission denied",
                                                "InotifyWatcher");
    EXPECT_EQ(error.code, 2001);
    EXPECT_EQ(error.component, "InotifyWatcher");
    EXPECT_EQ(error.message, "Failed to add watch: /tmp/x: Permission denied");
    EXPECT_EQ(error.toString(), "[InotifyWatcher] Failed to add watch: /tmp/x: Permission denied (code: 2001)");
    EXPECT_TRUE(Core::hasCode(error, Core::ErrorCode::WATCH_ADD_FAILED));
}

TEST(ErrorRegistryTest, CodeNames) {
    EXPECT_EQ(Core::ErrorRegistry::getErrorCodeString(Core::ErrorCode::LOCK_FAILURE), "LOCK_FAILURE");
    EXPECT_EQ(Core::ErrorRegistry::getMessage(Core::ErrorCode::INVALID_TICK_INTERVAL), "Invalid tick interval");
}

TEST(ResultTest, ValueAndErrorSides) {
    Result<int> ok(42);
    EXPECT_TRUE(ok.isOk());
    EXPECT_EQ(ok.value(), 42);
    EXPECT_THROW(ok.error(), std::runtime_error);

    Result<int> failed(Error("nope", 7));
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ(failed.valueOr(-1), -1);
    EXPECT_THROW(failed.value(), std::runtime_error);
}

TEST(ResultTest, ErrorBatchDescribesAllErrors) {
    Result<int, std::vector<Error>> batch(std::vector<Error>{Error("a"), Error("b")});
    try {
        batch.value();
        FAIL() << "value() on an error batch must throw";
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("2 error(s)"), std::string::npos);
        EXPECT_NE(what.find("b"), std::string::npos);
    }
}

TEST(ResultTest, VoidResult) {
    VoidResult ok = Ok();
    EXPECT_TRUE(ok.isOk());

    bool called = false;
    VoidResult failed(Error("broken"));
    failed.onError([&called](const Error& e) { called = e.message == "broken"; });
    EXPECT_TRUE(called);
}
