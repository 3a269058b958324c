#include "app/FrameCommand.hpp"
#include "build/LocalFileSystem.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace hframe;
namespace fs = std::filesystem;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Determine fixtures path
        fs::path test_dir = fs::path(__FILE__).parent_path();
        fixtures_dir = test_dir / ".." / "fixtures";
        ASSERT_TRUE(fs::exists(fixtures_dir)) << "Fixtures directory not found";

        work_dir = fs::temp_directory_path() / "hframe_end_to_end";
        fs::remove_all(work_dir);
        fs::create_directories(work_dir);

        document = read(fixtures_dir / "sample_project.md");
        ASSERT_FALSE(document.empty());
    }

    void TearDown() override {
        fs::remove_all(work_dir);
    }

    static std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    json run(BuildConfig config = {}) {
        FrameCommand command(std::make_shared<LocalFileSystem>(), config);
        return command.run(document, "sample_project.md", work_dir);
    }

    fs::path fixtures_dir;
    fs::path work_dir;
    std::string document;
};

TEST_F(EndToEndTest, BuildsSampleProject) {
    json summary = run();

    ASSERT_TRUE(summary["success"].get<bool>()) << summary.dump(2);
    EXPECT_EQ(summary["root"], (work_dir / "todo-app").string());
    EXPECT_EQ(summary["dirs"], 5);
    EXPECT_EQ(summary["files"], 6);
    EXPECT_EQ(summary["skipped"], 0);
    EXPECT_EQ(summary["fences"], 6);
    EXPECT_EQ(summary["fences_processed"], 6);
    EXPECT_EQ(summary["fences_failed"], 0);

    auto root = work_dir / "todo-app";
    EXPECT_EQ(read(root / "app.py"),
              "# Flask entry point\nfrom flask import Flask\n\napp = Flask(__name__)");
    EXPECT_EQ(read(root / "requirements.txt"), "flask==3.0.0");
    EXPECT_EQ(read(root / "static" / "style.css"), "/* Base styles */\nbody { margin: 0; }");
    EXPECT_NE(read(root / "templates" / "index.html").find("<ul id=\"todos\"></ul>"), std::string::npos);
    EXPECT_NE(read(root / "tests" / "test_app.py").find("def test_app_exists():"), std::string::npos);
    EXPECT_EQ(read(root / "config" / "settings.py"), "DEBUG = True");

    EXPECT_FALSE(fs::exists(work_dir / "handeeframer_log.txt"));
    EXPECT_TRUE(summary["log"].is_null());
}

TEST_F(EndToEndTest, SecondRunNeverOverwrites) {
    ASSERT_TRUE(run()["success"].get<bool>());
    json summary = run();

    ASSERT_TRUE(summary["success"].get<bool>()) << summary.dump(2);
    EXPECT_EQ(summary["dirs"], 0);
    EXPECT_EQ(summary["skipped"], 9);
    EXPECT_EQ(summary["files"], 6);

    auto root = work_dir / "todo-app";
    EXPECT_EQ(read(root / "requirements.txt"), "flask==3.0.0");
    EXPECT_EQ(read(root / "requirements (1).txt"), "flask==3.0.0");
    EXPECT_EQ(read(root / "app (1).py"), "from flask import Flask\n\napp = Flask(__name__)");
    EXPECT_TRUE(fs::exists(root / "static" / "style (1).css"));
    EXPECT_TRUE(fs::exists(root / "config" / "settings (1).py"));
}

TEST_F(EndToEndTest, KeepsLogWhenConfigured) {
    BuildConfig config;
    config.keep_log = true;

    json summary = run(config);

    auto log_file = work_dir / "handeeframer_log.txt";
    ASSERT_TRUE(fs::exists(log_file));
    EXPECT_EQ(summary["log"], log_file.string());

    std::string log = read(log_file);
    EXPECT_NE(log.find("HandeeFramer Build Log"), std::string::npos);
    EXPECT_NE(log.find("Code fence at line"), std::string::npos);
    EXPECT_NE(log.find("Status: SUCCESS"), std::string::npos);
}

TEST_F(EndToEndTest, DryRunPlansWithoutWriting) {
    FrameCommand command(std::make_shared<LocalFileSystem>(), BuildConfig{});
    json plan = command.plan(document, work_dir);

    EXPECT_EQ(plan["fences"].size(), 6u);
    EXPECT_EQ(plan["unnamed_fences"].size(), 1u);
    EXPECT_TRUE(plan["promoted"].get<bool>());
    EXPECT_TRUE(fs::is_empty(work_dir));
}
