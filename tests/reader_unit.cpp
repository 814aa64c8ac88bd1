// Covers block splitting and whole-document parsing, in memory and from the testdata fixtures.
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "subtitle_reader.hpp"

using namespace titleparser;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[reader_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_split_blocks() {
    auto blocks = split_cue_blocks(
        "\xEF\xBB\xBF"
        "1\r\n00:00:01,000 --> 00:00:02,000\r\nHi\r\n\r\n\r\n"
        "2\n00:00:03,000 --> 00:00:04,000\nThere\n \t\n"
        "3\n00:00:05,000 --> 00:00:06,000\nEnd");
    bool ok = check(blocks.size() == 3, "three blocks split on blank runs");
    if (!ok) {
        return false;
    }
    ok &= check(blocks[0] == "1\n00:00:01,000 --> 00:00:02,000\nHi", "BOM and CR dropped");
    ok &= check(blocks[1] == "2\n00:00:03,000 --> 00:00:04,000\nThere",
                "whitespace-only line separates blocks");
    ok &= check(blocks[2] == "3\n00:00:05,000 --> 00:00:06,000\nEnd", "last block without newline");

    ok &= check(split_cue_blocks("").empty(), "empty document has no blocks");
    ok &= check(split_cue_blocks("\n\n \n").empty(), "blank document has no blocks");
    return ok;
}

bool test_parse_cues_in_memory() {
    auto res = parse_cues(
        "WEBVTT\n\n"
        "NOTE a comment\n\n"
        "00:01.000 --> 00:02.000\nfirst\n\n"
        "broken block\n\n"
        "00:03.000 --> 00:04.000 line:0\n- second\n");
    bool ok = check(res.status.ok, "document parses");
    ok &= check(res.cues.size() == 2, "two cues kept");
    ok &= check(res.skipped_blocks == 1, "header and note are not counted as skipped");
    if (res.cues.size() == 2) {
        ok &= check(res.cues[0].text == "first", "first cue text");
        ok &= check(res.cues[1].text == "second", "second cue text");
        ok &= check(res.cues[1].start.to_milliseconds() == 3000, "second cue start");
    }

    // WEBVTT only counts as a header in the first block.
    auto late = parse_cues("00:01.000 --> 00:02.000\nx\n\nWEBVTT\n");
    ok &= check(late.cues.size() == 1 && late.skipped_blocks == 1, "late WEBVTT is a bad block");
    return ok;
}

bool test_srt_fixture(const std::string &path) {
    auto res = read_subtitle_file(path);
    bool ok = check(res.status.ok, "sample.srt reads");
    ok &= check(res.cues.size() == 3, "sample.srt has three cues");
    ok &= check(res.skipped_blocks == 1, "sample.srt has one bad block");
    if (res.cues.size() != 3) {
        return false;
    }
    ok &= check(res.cues[0].text == "Hello there.\nGeneral Kenobi!", "sample.srt cue 1 text");
    ok &= check(res.cues[0].start.string == "00:00:01,000", "sample.srt cue 1 start");
    ok &= check(res.cues[1].text == "Tom  Jerry", "sample.srt cue 2 text");
    ok &= check(res.cues[2].start.to_milliseconds() == 3723004, "sample.srt cue 4 start");
    ok &= check(res.cues[2].end.to_seconds() == 3725, "sample.srt cue 4 end");
    return ok;
}

bool test_vtt_fixture(const std::string &path) {
    auto res = read_subtitle_file(path);
    bool ok = check(res.status.ok, "sample.vtt reads");
    ok &= check(res.cues.size() == 2, "sample.vtt has two cues");
    ok &= check(res.skipped_blocks == 1, "sample.vtt has one bad block");
    if (res.cues.size() != 2) {
        return false;
    }
    ok &= check(res.cues[0].text == "（聖弥）フフッ", "sample.vtt cue 1 text");
    ok &= check(res.cues[0].start.string == "00:13.916", "sample.vtt cue 1 start");
    ok &= check(res.cues[0].end.string == "00:16.500", "sample.vtt settings dropped");
    ok &= check(res.cues[1].text == "First line\nsecond line", "sample.vtt cue 2 text");
    return ok;
}

bool test_missing_file() {
    auto missing = std::filesystem::temp_directory_path() / "titleparser_missing.srt";
    std::filesystem::remove(missing);
    auto res = read_subtitle_file(missing.string());
    bool ok = check(!res.status.ok, "missing file fails");
    ok &= check(res.status.error == ParseError::Io, "missing file reports Io");
    ok &= check(res.cues.empty(), "missing file yields no cues");
    return ok;
}

bool test_temp_file_roundtrip() {
    auto tmp = std::filesystem::temp_directory_path() / "reader_unit.vtt";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << "WEBVTT\n\n1\n00:00:00.000 --> 00:00:01.000\n<b>bold</b>\n";
    }
    auto res = read_subtitle_file(tmp.string());
    std::filesystem::remove(tmp);
    bool ok = check(res.status.ok && res.cues.size() == 1, "temp file has one cue");
    ok &= check(res.cues.size() == 1 && res.cues[0].text == "bold", "temp file cue text");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: reader_unit <TESTDATA_DIR>\n";
        return 2;
    }
    const std::string testdata_dir = argv[1];
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_split_blocks();
    ok &= test_parse_cues_in_memory();
    ok &= test_srt_fixture(testdata_dir + "/sample.srt");
    ok &= test_vtt_fixture(testdata_dir + "/sample.vtt");
    ok &= test_missing_file();
    ok &= test_temp_file_roundtrip();
    if (ok) {
        std::cout << "reader_unit OK\n";
    }
    return ok ? 0 : 1;
}
