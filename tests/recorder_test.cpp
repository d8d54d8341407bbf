#include "hostfan/recorder.hpp"

#include "test_utils.h"

#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>

#include <unistd.h>

namespace {

constexpr std::string_view k_failure_prefix = "recorder_test: ";

namespace fs = std::filesystem;

void write_to(const hostfan::AttemptFile& file, const std::string& text)
{
    hostfan::test::require_true(::write(file.fd(), text.data(), text.size()) ==
                                    static_cast<ssize_t>(text.size()),
                                k_failure_prefix,
                                "write into attempt artifact failed");
}

void test_artifact_names()
{
    hostfan::AttemptRecorder recorder("out");
    hostfan::test::require_true(recorder.attemptPath(3, 0) == fs::path("out") / "cmd_3-attempt0.log",
                                k_failure_prefix,
                                "attempt name must encode id and sequence");
    hostfan::test::require_true(recorder.attemptPath(12, 4) == fs::path("out") / "cmd_12-attempt4.log",
                                k_failure_prefix,
                                "attempt name must encode id and sequence");
    hostfan::test::require_true(recorder.finalPath(12) == fs::path("out") / "cmd_12-final.log",
                                k_failure_prefix,
                                "final name must depend on the id only");
}

void test_begin_creates_artifact()
{
    hostfan::test::Temp_directory dir("recorder_begin");
    hostfan::AttemptRecorder recorder(dir.path());

    hostfan::BeginResult begun = recorder.begin(0, 0);
    hostfan::test::require_true(begun.ok && begun.file.isOpen(),
                                k_failure_prefix,
                                "begin should open a fresh artifact");
    hostfan::test::require_true(fs::exists(recorder.attemptPath(0, 0)),
                                k_failure_prefix,
                                "artifact must exist as soon as the attempt begins");

    write_to(begun.file, "partial output\n");
    begun.file.close();
    hostfan::test::require_true(hostfan::test::read_file(recorder.attemptPath(0, 0)) == "partial output\n",
                                k_failure_prefix,
                                "output written before close must be in the artifact");
}

void test_promote_moves_to_final_name()
{
    hostfan::test::Temp_directory dir("recorder_promote");
    hostfan::AttemptRecorder recorder(dir.path());

    hostfan::BeginResult begun = recorder.begin(5, 2);
    hostfan::test::require_true(begun.ok, k_failure_prefix, "begin failed");
    write_to(begun.file, "done\n");

    hostfan::PromoteResult promoted = recorder.promote(5, std::move(begun.file));
    hostfan::test::require_true(promoted.ok,
                                k_failure_prefix,
                                "promotion into a writable directory should succeed");
    hostfan::test::require_true(promoted.path == recorder.finalPath(5),
                                k_failure_prefix,
                                "promotion should report the final path");
    hostfan::test::require_true(!fs::exists(recorder.attemptPath(5, 2)),
                                k_failure_prefix,
                                "attempt artifact is renamed, not copied");
    hostfan::test::require_true(hostfan::test::read_file(recorder.finalPath(5)) == "done\n",
                                k_failure_prefix,
                                "final artifact must hold the attempt output");
}

void test_promote_failure_keeps_attempt()
{
    hostfan::test::Temp_directory dir("recorder_degraded");
    hostfan::AttemptRecorder recorder(dir.path());

    // A non-empty directory under the final name makes the rename fail
    fs::create_directories(recorder.finalPath(1) / "blocker");

    hostfan::BeginResult begun = recorder.begin(1, 0);
    hostfan::test::require_true(begun.ok, k_failure_prefix, "begin failed");
    write_to(begun.file, "kept\n");

    hostfan::PromoteResult promoted = recorder.promote(1, std::move(begun.file));
    hostfan::test::require_true(!promoted.ok,
                                k_failure_prefix,
                                "promotion onto a directory must fail");
    hostfan::test::require_true(promoted.path == recorder.attemptPath(1, 0),
                                k_failure_prefix,
                                "degraded promotion must point at the attempt artifact");
    hostfan::test::require_true(!promoted.message.empty(),
                                k_failure_prefix,
                                "degraded promotion should explain itself");
    hostfan::test::require_true(hostfan::test::read_file(recorder.attemptPath(1, 0)) == "kept\n",
                                k_failure_prefix,
                                "attempt artifact must survive a failed promotion");
}

void test_begin_fails_without_directory()
{
    hostfan::test::Temp_directory dir("recorder_missing");
    hostfan::AttemptRecorder recorder(dir.path() / "does" / "not" / "exist");

    hostfan::BeginResult begun = recorder.begin(0, 0);
    hostfan::test::require_true(!begun.ok && !begun.file.isOpen(),
                                k_failure_prefix,
                                "begin must fail when the artifact cannot be created");
    hostfan::test::require_true(begun.message.find("cmd_0-attempt0.log") != std::string::npos,
                                k_failure_prefix,
                                "failure message should name the artifact");
}

void test_prepare()
{
    hostfan::test::Temp_directory dir("recorder_prepare");
    std::string error;

    hostfan::AttemptRecorder nested(dir.path() / "a" / "b");
    hostfan::test::require_true(nested.prepare(error) && fs::is_directory(dir.path() / "a" / "b"),
                                k_failure_prefix,
                                "prepare should create the output directory");

    hostfan::test::write_file(dir.path() / "plain", "x");
    hostfan::AttemptRecorder onFile(dir.path() / "plain");
    hostfan::test::require_true(!onFile.prepare(error) && !error.empty(),
                                k_failure_prefix,
                                "prepare must reject a regular file as output directory");
}

void test_attempt_file_moves()
{
    hostfan::test::Temp_directory dir("recorder_move");
    hostfan::AttemptRecorder recorder(dir.path());

    hostfan::BeginResult begun = recorder.begin(2, 0);
    hostfan::test::require_true(begun.ok, k_failure_prefix, "begin failed");
    const int fd = begun.file.fd();

    hostfan::AttemptFile moved(std::move(begun.file));
    hostfan::test::require_true(!begun.file.isOpen() && moved.fd() == fd,
                                k_failure_prefix,
                                "moving an attempt file transfers the descriptor");
    hostfan::test::require_true(moved.sync(),
                                k_failure_prefix,
                                "sync of an open attempt should succeed");
    moved.close();
    hostfan::test::require_true(!moved.isOpen() && !moved.sync(),
                                k_failure_prefix,
                                "closed attempt cannot be synced");
}

} // namespace

int main()
{
    try {
        test_artifact_names();
        test_begin_creates_artifact();
        test_promote_moves_to_final_name();
        test_promote_failure_keeps_attempt();
        test_begin_fails_without_directory();
        test_prepare();
        test_attempt_file_moves();
    }
    catch (const std::exception& ex) {
        std::fprintf(stderr, "recorder_test failed: %s\n", ex.what());
        return 1;
    }

    std::fprintf(stderr, "recorder_test passed\n");
    return 0;
}
