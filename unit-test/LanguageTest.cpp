#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "judge/compilation.hpp"
#include "judge/language.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace mjudge;

class LanguageTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }
};

TEST_F(LanguageTest, BuiltinLanguagesTest) {
    language_registry languages;
    EXPECT_TRUE(languages.contains("C11 / gcc"));
    EXPECT_TRUE(languages.contains("C++17 / g++"));
    EXPECT_TRUE(languages.contains("Bash"));
    EXPECT_FALSE(languages.contains("Brainfuck"));
    EXPECT_THROW(languages.get("Brainfuck"), internal_error);
}

TEST_F(LanguageTest, SourcesExpandToMultipleArgumentsTest) {
    language_registry languages;
    auto &cpp = languages.get("C++17 / g++");
    auto commands = cpp.get_compilation_commands({"a.cpp", "b.cpp"}, "a_b");
    ASSERT_EQ(commands.size(), 1);
    vector<string> expected = {"/usr/bin/g++", "-DEVAL", "-std=gnu++17", "-O2", "-pipe", "-static", "-s", "-o", "a_b", "a.cpp", "b.cpp"};
    EXPECT_EQ(commands[0], expected);
}

TEST_F(LanguageTest, EvaluationCommandsTest) {
    language_registry languages;
    auto commands = languages.get("Bash").get_evaluation_commands("user.sh", "user");
    ASSERT_EQ(commands.size(), 1);
    EXPECT_EQ(commands[0], vector<string>({"/bin/bash", "user.sh"}));

    commands = languages.get("C11 / gcc").get_evaluation_commands("sum", "sum");
    EXPECT_EQ(commands[0], vector<string>({"./sum"}));
}

TEST_F(LanguageTest, ExecutableFilenameTest) {
    language_registry languages;
    EXPECT_EQ(executable_filename({"sum.%l"}, languages.get("C11 / gcc")), "sum");
    EXPECT_EQ(executable_filename({"grader.%l", "encoder.%l"}, languages.get("C11 / gcc")), "encoder_grader");
}

TEST_F(LanguageTest, LoadFromJsonTest) {
    path dir = fresh_temp_dir();
    write_file_content(dir / "languages.json", R"([
    {
        "name": "Java / JDK",
        "source_extension": ".java",
        "executable_extension": ".jar",
        "compile": [["/usr/bin/javac", "{sources}"], ["/usr/bin/jar", "cf", "{executable}", "{main}.class"]],
        "evaluate": [["/usr/bin/unzip", "{executable}"], ["/usr/bin/java", "{main}"]]
    }
])");

    language_registry languages;
    languages.load(dir / "languages.json");
    ASSERT_TRUE(languages.contains("Java / JDK"));

    auto &java = languages.get("Java / JDK");
    auto compile = java.get_compilation_commands({"Main.java"}, "Main.jar");
    ASSERT_EQ(compile.size(), 2);
    EXPECT_EQ(compile[1], vector<string>({"/usr/bin/jar", "cf", "Main.jar", "Main.class"}));

    auto evaluate = java.get_evaluation_commands("Main.jar", "Main");
    ASSERT_EQ(evaluate.size(), 2);
    EXPECT_EQ(evaluate[1], vector<string>({"/usr/bin/java", "Main"}));
}
