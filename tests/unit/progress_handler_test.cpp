/**
 * progress_handler_test.cpp - progress display implementations
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "exec/print_progress_handler.hpp"
#include "exec/spinner_progress_handler.hpp"
#include "exec/void_progress_handler.hpp"

using namespace envkeeper::exec;

TEST(ProgressPrefixTest, PadsToTotalWidth) {
    EXPECT_EQ(progress_prefix(std::nullopt), "");
    EXPECT_EQ(progress_prefix(std::make_pair<size_t, size_t>(3, 12)), "[ 3/12] ");
    EXPECT_EQ(progress_prefix(std::make_pair<size_t, size_t>(1, 1)), "[1/1] ");
}

TEST(PrintProgressHandlerTest, OneLinePerUpdate) {
    std::stringstream out;
    PrintProgressHandler handler("mise install", std::make_pair<size_t, size_t>(2, 3), out);

    handler.progress("downloading node");
    handler.println("raw line");
    handler.success();

    EXPECT_EQ(out.str(),
              "[2/3] - mise install downloading node\n"
              "raw line\n"
              "[2/3] ✔ mise install done\n");
}

TEST(PrintProgressHandlerTest, ErrorWithMessage) {
    std::stringstream out;
    PrintProgressHandler handler("brew install", std::nullopt, out);
    handler.error_with_message("exit status 1");
    EXPECT_EQ(out.str(), "✖ brew install exit status 1\n");
}

TEST(SpinnerProgressHandlerTest, FinishesOnceWithFinalLine) {
    std::stringstream out;
    {
        SpinnerProgressHandler handler("cargo install", std::nullopt, out);
        handler.progress("compiling");
        handler.success_with_message("installed");
        handler.error_with_message("ignored after finish");
        EXPECT_TRUE(handler.finished());
    }

    std::string text = out.str();
    EXPECT_NE(text.find("✔ cargo install installed"), std::string::npos);
    EXPECT_EQ(text.find("ignored after finish"), std::string::npos);
}

TEST(SpinnerProgressHandlerTest, ErrorKeepsLastProgressMessage) {
    std::stringstream out;
    SpinnerProgressHandler handler("go install", std::nullopt, out);
    handler.progress("fetching module");
    handler.error();
    EXPECT_NE(out.str().find("✖ go install fetching module"), std::string::npos);
}

TEST(SpinnerProgressHandlerTest, HideAndShow) {
    std::stringstream out;
    SpinnerProgressHandler handler("sudo", std::nullopt, out);
    handler.hide();
    EXPECT_TRUE(handler.hidden());
    handler.show();
    EXPECT_FALSE(handler.hidden());
    handler.success();
}

TEST(VoidProgressHandlerTest, AcceptsEverything) {
    VoidProgressHandler handler;
    IProgressHandler &base = handler;
    base.progress("ignored");
    base.hide();
    base.show();
    base.success();
}
