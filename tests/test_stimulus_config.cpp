// All comments are in English.
// Stimulus JSON parsing, suite runner, CSV traces and the side-by-side
// Mealy/Moore latency check.

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "runner/simulation.hpp"

using namespace sd;
using nlohmann::json;

namespace {
int g_failures = 0;
void CHECK(bool cond, const std::string& msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn fn) {
    try { fn(); } catch (const std::invalid_argument&) { return true; }
    return false;
}

std::filesystem::path ScratchDir() {
    const auto dir = std::filesystem::temp_directory_path() / "seqdet_test_stimulus_config";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void TEST_ParseFile() {
    std::cout << "[RUN ] ParseFile\n";
    const auto dir = ScratchDir();
    const auto path = dir / "stim.json";
    {
        std::ofstream ofs(path);
        ofs << R"({
          "detectors": ["moore", "moore"],
          "print_traces": false,
          "stimuli": [
            { "name": "overlap", "bits": "1011011", "expect": { "moore": [7, 4] } },
            { "bits": "1011_1011", "reset_at": [3], "drain_cycles": 2 }
          ]
        })";
    }
    const SimConfig cfg = ParseStimulusConfig(path.string());
    CHECK(cfg.detectors.size() == 1 && cfg.detectors[0] == DetectorKind::kMoore, "duplicates collapse");
    CHECK(!cfg.print_traces, "print_traces read");
    CHECK(cfg.trace_csv_dir.empty(), "no CSV dir by default");
    CHECK(cfg.stimuli.size() == 2, "two stimuli");
    CHECK(cfg.stimuli[0].expect_moore && *cfg.stimuli[0].expect_moore == std::vector<uint64_t>({4, 7}),
          "expected cycles are sorted");
    CHECK(!cfg.stimuli[0].expect_mealy, "no Mealy expectation given");
    CHECK(cfg.stimuli[1].name == "stim1", "default stimulus name");
    CHECK(cfg.stimuli[1].reset_cycles.count(3) == 1, "reset_at read");
    CHECK(cfg.stimuli[1].drain_cycles == 2, "drain_cycles read");
    std::filesystem::remove_all(dir);
    std::cout << "[DONE] ParseFile\n";
}

void TEST_SchemaErrors() {
    std::cout << "[RUN ] SchemaErrors\n";
    CHECK(ThrowsInvalidArgument([] { ParseStimulusConfigJson(json::object()); }),
          "missing stimuli array");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"detectors":["mealy","fsm"],"stimuli":[]})"));
          }),
          "unknown detector");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"10a1"}]})"));
          }),
          "malformed bits");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"name":"x"}]})"));
          }),
          "missing bits");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","reset_at":[-1]}]})"));
          }),
          "negative reset cycle");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","expect":{"mealy":[0],"x":[]}}]})"));
          }),
          "unknown detector in expect");


    // Wrong JSON types are reported as schema errors, not json::type_error.
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"detectors":[1],"stimuli":[]})"));
          }),
          "non-string detector");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":1011}]})"));
          }),
          "numeric bits");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","name":7}]})"));
          }),
          "numeric name");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","drain_cycles":"2"}]})"));
          }),
          "string drain_cycles");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"print_traces":"yes","stimuli":[]})"));
          }),
          "non-bool print_traces");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"trace_csv_dir":3,"stimuli":[]})"));
          }),
          "non-string trace_csv_dir");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","reset_at":[1.5]}]})"));
          }),
          "fractional reset cycle");
    std::cout << "[DONE] SchemaErrors\n";
}

void TEST_DrainCyclesRange() {
    std::cout << "[RUN ] DrainCyclesRange\n";
    // 2^32 + 1 must not wrap around to 1.
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","drain_cycles":4294967297}]})"));
          }),
          "drain_cycles above INT_MAX");
    CHECK(ThrowsInvalidArgument([] {
              ParseStimulusConfigJson(json::parse(R"({"stimuli":[{"bits":"1","drain_cycles":-1}]})"));
          }),
          "negative drain_cycles");
    const SimConfig cfg = ParseStimulusConfigJson(
        json::parse(R"({"stimuli":[{"bits":"1","drain_cycles":2147483647},{"bits":"1","drain_cycles":0}]})"));
    CHECK(cfg.stimuli[0].drain_cycles == 2147483647, "INT_MAX accepted");
    CHECK(cfg.stimuli[1].drain_cycles == 0, "zero accepted");

    // Large unsigned cycle numbers are valid cycle indices.
    const SimConfig big = ParseStimulusConfigJson(
        json::parse(R"({"stimuli":[{"bits":"1","expect":{"mealy":[18446744073709551615]}}]})"));
    CHECK(big.stimuli[0].expect_mealy &&
              big.stimuli[0].expect_mealy->front() == 18446744073709551615ull,
          "uint64 max accepted as a cycle index");
    std::cout << "[DONE] DrainCyclesRange\n";
}

void TEST_ResetPastLastCycleWarns() {
    std::cout << "[RUN ] ResetPastLastCycleWarns\n";
    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
    // "1011" + 1 drain cycle = cycles 0..4; cycle 5 is never reached.
    const SimConfig cfg = ParseStimulusConfigJson(
        json::parse(R"({"stimuli":[{"name":"late","bits":"1011","reset_at":[4,5]}]})"));
    std::cerr.rdbuf(old);

    CHECK(cfg.stimuli[0].reset_cycles.count(4) == 1, "last cycle kept");
    CHECK(cfg.stimuli[0].reset_cycles.count(5) == 0, "out-of-range cycle dropped");
    CHECK(captured.str().find("[ParseConfig][Warn] late: reset_at 5") != std::string::npos,
          "warning names the stimulus and the cycle");
    std::cout << "[DONE] ResetPastLastCycleWarns\n";
}

void TEST_UnreadableFile() {
    std::cout << "[RUN ] UnreadableFile\n";
    bool threw = false;
    try { (void)ParseStimulusConfig("/nonexistent/seqdet/stim.json"); }
    catch (const std::runtime_error&) { threw = true; }
    CHECK(threw, "unreadable file must throw std::runtime_error");
    std::cout << "[DONE] UnreadableFile\n";
}

void TEST_SideBySide() {
    std::cout << "[RUN ] SideBySide\n";
    Stimulus s;
    s.name = "overlap";
    s.bits = "1011011";
    const LatencyCheck chk = RunSideBySide(s);
    CHECK(chk.mealy_cycles == std::vector<uint64_t>({3, 6}), "Mealy cycles");
    CHECK(chk.moore_cycles == std::vector<uint64_t>({4, 7}), "Moore cycles");
    CHECK(chk.consistent, "Moore lags Mealy by one cycle");

    // Last Mealy hit lands on the final cycle; it has no Moore counterpart.
    s.drain_cycles = 0;
    const LatencyCheck tail = RunSideBySide(s);
    CHECK(tail.moore_cycles == std::vector<uint64_t>({4}), "only the first Moore hit is visible");
    CHECK(tail.consistent, "truncated tail is still consistent");

    for (const auto& d : DefaultStimuli()) {
        CHECK(RunSideBySide(d).consistent, "side-by-side consistency: " + d.name);
    }
    std::cout << "[DONE] SideBySide\n";
}

void TEST_RunSuiteWritesCsv() {
    std::cout << "[RUN ] RunSuiteWritesCsv\n";
    const auto dir = ScratchDir();

    SimConfig cfg = DefaultConfig();
    cfg.print_traces  = false;
    cfg.trace_csv_dir = (dir / "traces").string();

    std::ostringstream os;
    const SuiteSummary sum = RunSuite(cfg, os);
    CHECK(sum.Passed(), "default suite passes");
    CHECK(sum.runs == static_cast<int>(2 * cfg.stimuli.size()), "every stimulus on both detectors");
    CHECK(sum.totals.detections == 2 * (1 + 2 + 0 + 0 + 1 + 2), "total detections over both variants");

    const auto csv = dir / "traces" / "moore__1_overlap__trace.csv";
    CHECK(std::filesystem::exists(csv), "Moore overlap trace exists");
    std::ifstream ifs(csv);
    std::string header, line;
    std::getline(ifs, header);
    CHECK(header == "cycle,reset,data_in,state_before,state_after,detected", "CSV header");
    int rows = 0, hits = 0;
    while (std::getline(ifs, line)) {
        ++rows;
        if (!line.empty() && line.back() == '1') ++hits;
    }
    CHECK(rows == 8, "7 bits + 1 drain cycle");
    CHECK(hits == 2, "two detections in the CSV");
    CHECK(os.str().find("mismatches=0") != std::string::npos, "summary printed");

    // Names that sanitize to the same string still get separate files.
    SimConfig twins;
    twins.print_traces  = false;
    twins.detectors     = {DetectorKind::kMealy};
    twins.trace_csv_dir = (dir / "twins").string();
    Stimulus ta;
    ta.name = "a b";
    ta.bits = "1011";
    Stimulus tb = ta;
    tb.name = "a_b";
    tb.bits = "0";
    twins.stimuli = {ta, tb};
    std::ostringstream os_twins;
    (void)RunSuite(twins, os_twins);
    CHECK(std::filesystem::exists(dir / "twins" / "mealy__0_a_b__trace.csv"), "first twin trace");
    CHECK(std::filesystem::exists(dir / "twins" / "mealy__1_a_b__trace.csv"), "second twin trace");
    std::ifstream first(dir / "twins" / "mealy__0_a_b__trace.csv");
    int first_rows = -1;  // header
    for (std::string l; std::getline(first, l);) ++first_rows;
    CHECK(first_rows == 5, "first twin keeps its own 5 rows");

    // A failing expectation is reported, not thrown.
    SimConfig bad;
    bad.print_traces = false;
    Stimulus s;
    s.name = "wrong";
    s.bits = "1011";
    s.expect_mealy = std::vector<uint64_t>{4};
    bad.stimuli.push_back(s);
    std::ostringstream os2;
    const SuiteSummary bsum = RunSuite(bad, os2);
    CHECK(bsum.mismatches == 1 && !bsum.Passed(), "mismatch counted");

    std::filesystem::remove_all(dir);
    std::cout << "[DONE] RunSuiteWritesCsv\n";
}

} // namespace

int main() {
    std::cout << "=== Stimulus Config / Suite Tests ===\n";
    TEST_ParseFile();
    TEST_SchemaErrors();
    TEST_DrainCyclesRange();
    TEST_ResetPastLastCycleWarns();
    TEST_UnreadableFile();
    TEST_SideBySide();
    TEST_RunSuiteWritesCsv();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
