#include <gtest/gtest.h>
#include <session/output_cleaner.hpp>

static const MarkerSet kMarkers = {"===START42===", "===END42===", "===EXIT42==="};

TEST(CleanOutput, StripsColorSequences) {
    EXPECT_EQ(clean_output("\x1b[1;32mgreen\x1b[0m text"), "green text");
}

TEST(CleanOutput, StripsTitleAndBracketedPaste) {
    EXPECT_EQ(clean_output("\x1b]0;user@host: ~\x07\x1b[?2004hls\x1b[?2004l"), "ls");
}

TEST(CleanOutput, StripsCharsetAndKeypadModes) {
    EXPECT_EQ(clean_output("\x1b(Bplain\x1b="), "plain");
}

TEST(CleanOutput, NormalizesLineEndings) {
    EXPECT_EQ(clean_output("a\r\nb\rc\n"), "a\nb\nc");
}

TEST(CleanOutput, DropsBackspaceAndBell) {
    EXPECT_EQ(clean_output("ab\bc\x07"), "abc");
}

TEST(CleanOutput, CollapsesBlankRuns) {
    EXPECT_EQ(clean_output("a\n\n\n\n\nb"), "a\n\nb");
}

TEST(CleanOutput, TrimsLinesAndText) {
    EXPECT_EQ(clean_output("  \n  first   \nsecond\t\n\n"), "first\nsecond");
}

TEST(CleanOutput, PlainTextUnchangedApartFromWhitespace) {
    std::string plain = "total 8\ndrwxr-xr-x 2 root root 4096 .\n-rw-r--r-- 1 root root 12 notes.txt";
    EXPECT_EQ(clean_output(plain), plain);
    EXPECT_EQ(full_clean_output(plain + "   \n\n\n", "ls -la"), plain);
}

TEST(CleanMarkers, DropsMarkerLinesAndEchoCommands) {
    std::string text =
        "echo '===START42==='\n"
        "===START42===\n"
        "hello\n"
        "===EXIT42===0\n"
        "echo \"===whatever===\"\n"
        "===END42===";
    EXPECT_EQ(clean_markers(text, kMarkers), "hello");
}

TEST(CleanMarkers, KeepsOrdinaryEchoLines) {
    EXPECT_EQ(clean_markers("echo 'hi'\nhi", kMarkers), "echo 'hi'\nhi");
}

TEST(CleanCommandEcho, DropsFirstEchoOnly) {
    std::string text = "ls -la\n\nfile1\nls-notes.txt";
    EXPECT_EQ(clean_command_echo(text, "ls -la"), "file1\nls-notes.txt");
}

TEST(CleanCommandEcho, MatchesEchoInsidePromptLine) {
    EXPECT_EQ(clean_command_echo("user@box:~$ cat notes\ncontents", "cat notes"), "contents");
}

TEST(CleanCommandEcho, NothingToDropKeepsLines) {
    EXPECT_EQ(clean_command_echo("one\n\ntwo", "pwd"), "one\ntwo");
}

TEST(CleanPrompt, DropsCommonPromptShapes) {
    std::string text =
        "user@host:~$\n"
        "root@box:/var/log#\n"
        "$\n"
        "#  \n"
        "%\n"
        "~\n"
        "\xe2\x9d\xaf\n"
        "(venv) $\n"
        "[user@host]$\n"
        "kept";
    EXPECT_EQ(clean_prompt(text), "kept");
}

TEST(CleanPrompt, DropsPromptWithMarkerEcho) {
    std::string text =
        "user@host:~$echo '===END1==='\n"
        "(base) user@host:~/src$echo hi\n"
        "result";
    EXPECT_EQ(clean_prompt(text), "result");
}

TEST(CleanPrompt, KeepsOutputThatMerelyMentionsDollar) {
    EXPECT_EQ(clean_prompt("price is $5\ncost: 3"), "price is $5\ncost: 3");
}

TEST(FullClean, RunsStagesInOrder) {
    std::string raw =
        "\r\n\x1b[01;32muser@host\x1b[00m:~$ echo hello\r\n"
        "hello\r\n"
        "user@host:~$ echo '===EXIT42==='$?\r\n"
        "===EXIT42===0\r\n"
        "user@host:~$ echo '===END42==='\r\n";
    EXPECT_EQ(full_clean_output(raw, "echo hello", kMarkers), "hello");
}

TEST(FullClean, WithoutMarkersSkipsMarkerStage) {
    EXPECT_EQ(full_clean_output("pwd\n/home/user\n$ ", "pwd"), "/home/user");
}
