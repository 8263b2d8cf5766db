#include "Logger.h"
#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

class CaptureHandler : public ppi::logging::Handler {
public:
    void emit(ppi::logging::Level level, const std::string &loggerName,
              const std::string &message) override {
        if (level < level_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        names.push_back(loggerName);
        messages.push_back(message);
    }

    std::vector<std::string> names;
    std::vector<std::string> messages;

private:
    std::mutex mutex_;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
    auto rootLogger = ppi::logging::getRootLogger();
    EXPECT_NO_THROW({
        rootLogger.debug << "Debug message";
        rootLogger.info << "Info message";
        rootLogger.warning << "Warning message";
        rootLogger.error << "Error message";
        rootLogger.critical << "Critical message";
    });
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
    auto namedLogger = ppi::logging::getLogger("myapp");
    EXPECT_EQ(namedLogger.getName(), "myapp");
    EXPECT_EQ(namedLogger.getFullName(), "myapp");
    EXPECT_NO_THROW(namedLogger.info << "Test message");
}

TEST(LoggerTest, SameNameReturnsSameNode) {
    auto first = ppi::logging::getLogger("same.node");
    auto second = ppi::logging::getLogger("same.node");
    EXPECT_EQ(first, second);
    EXPECT_NE(first, ppi::logging::getLogger("same.other"));
}

TEST(LoggerTest, LevelFiltersMessages) {
    auto logger = ppi::logging::getLogger("level_filter");
    logger.setPropagate(false);
    auto spCapture = std::make_shared<CaptureHandler>();
    logger.addHandler(spCapture);

    logger.setLevel(ppi::logging::Level::WARNING);
    EXPECT_EQ(logger.getLevel(), ppi::logging::Level::WARNING);

    logger.debug << "hidden";
    logger.info << "hidden";
    logger.warning << "shown " << 1;
    logger.error << "shown " << 2;

    ASSERT_EQ(spCapture->messages.size(), 2u);
    EXPECT_NE(spCapture->messages[0].find("[WARNING] [level_filter] shown 1"), std::string::npos);
    EXPECT_NE(spCapture->messages[1].find("[ERROR] [level_filter] shown 2"), std::string::npos);
}

TEST(LoggerTest, HandlerLevelFiltersMessages) {
    auto logger = ppi::logging::getLogger("handler_filter");
    logger.setPropagate(false);
    auto spCapture = std::make_shared<CaptureHandler>();
    spCapture->setLevel(ppi::logging::Level::ERROR);
    logger.addHandler(spCapture);

    logger.warning << "hidden";
    logger.critical << "shown";

    ASSERT_EQ(spCapture->messages.size(), 1u);
    EXPECT_NE(spCapture->messages[0].find("[CRITICAL]"), std::string::npos);
}

TEST(LoggerTest, ParseLevelAcceptsConfigNames) {
    ppi::logging::Level level = ppi::logging::Level::DEBUG;
    EXPECT_TRUE(ppi::logging::parseLevel("info", level));
    EXPECT_EQ(level, ppi::logging::Level::INFO);
    EXPECT_TRUE(ppi::logging::parseLevel("WARNING", level));
    EXPECT_EQ(level, ppi::logging::Level::WARNING);
    EXPECT_TRUE(ppi::logging::parseLevel("warn", level));
    EXPECT_EQ(level, ppi::logging::Level::WARNING);
    EXPECT_TRUE(ppi::logging::parseLevel("Critical", level));
    EXPECT_EQ(level, ppi::logging::Level::CRITICAL);

    EXPECT_FALSE(ppi::logging::parseLevel("verbose", level));
    EXPECT_EQ(level, ppi::logging::Level::CRITICAL);
}

TEST(LoggerTest, FileHandlerWorks) {
    auto fileLogger = ppi::logging::getLogger("file_test");
    EXPECT_NO_THROW(fileLogger.addFileHandler("test.log", ppi::logging::Level::DEBUG));
    EXPECT_NO_THROW({
        fileLogger.debug << "Debug message";
        fileLogger.info << "Info message";
    });
}

TEST(LoggerTest, FileHandlerThrowsOnBadPath) {
    auto logger = ppi::logging::getLogger("file_bad");
    EXPECT_THROW(logger.addFileHandler("/nonexistent-dir/sub/test.log"), std::runtime_error);
}

TEST(LoggerTest, ChildPropagatesToParentHandlers) {
    auto parent = ppi::logging::getLogger("prop_parent");
    auto child = ppi::logging::getLogger("prop_parent.child");
    parent.setPropagate(false);
    auto spCapture = std::make_shared<CaptureHandler>();
    parent.addHandler(spCapture);

    EXPECT_TRUE(child.getPropagate());
    child.info << "from child";
    ASSERT_EQ(spCapture->names.size(), 1u);
    EXPECT_EQ(spCapture->names[0], "prop_parent.child");

    child.setPropagate(false);
    EXPECT_FALSE(child.getPropagate());
    child.info << "not propagated";
    EXPECT_EQ(spCapture->names.size(), 1u);
}

TEST(LoggerTest, RedirectMovesLoggerUnderTarget) {
    auto source = ppi::logging::getLogger("redirect_src");
    auto target = ppi::logging::getLogger("redirect_dst");
    target.setPropagate(false);
    auto spCapture = std::make_shared<CaptureHandler>();
    target.addHandler(spCapture);

    source.redirectTo("redirect_dst");
    EXPECT_EQ(source.getName(), "redirect_src");
    EXPECT_EQ(source.getFullName(), "redirect_dst.redirect_src");

    source.info << "via target";
    ASSERT_EQ(spCapture->names.size(), 1u);
    EXPECT_EQ(spCapture->names[0], "redirect_dst.redirect_src");
}

TEST(LoggerTest, RedirectToNewHierarchyCreatesIt) {
    auto logger = ppi::logging::getLogger("hierarchy.A");
    logger.redirectTo("system.B");
    EXPECT_EQ(logger.getName(), "A");
    EXPECT_EQ(logger.getFullName(), "system.B.A");
    EXPECT_EQ(ppi::logging::getLogger("system.B").getFullName(), "system.B");
}

TEST(LoggerTest, PreventCircularRedirection) {
    auto loggerA = ppi::logging::getLogger("loggerA");
    auto loggerB = ppi::logging::getLogger("loggerB");
    auto loggerC = ppi::logging::getLogger("loggerC");

    loggerA.redirectTo("loggerB");
    loggerB.redirectTo("loggerC");

    // Registry names stay valid after a redirect
    EXPECT_THROW(loggerC.redirectTo("loggerA"), std::invalid_argument);
    EXPECT_THROW(loggerA.redirectTo("loggerA"), std::invalid_argument);
}
