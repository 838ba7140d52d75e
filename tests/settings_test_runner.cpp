#include "command_line_parser.hpp"
#include "copy_session.hpp"
#include "log.hpp"
#include "progress_meter.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rcopy::test;
using namespace std::chrono_literals;

namespace {

template<typename Fn>
std::string expect_command_line_error(Fn&& fn, const std::string& what) {
  try {
    fn();
  } catch(const CommandLineError& e) {
    return e.what();
  }
  throw CheckFailed(what + ": no CommandLineError");
}

CommandLineParser parser_for(const SettingsManager& settings) {
  return CommandLineParser("rcopy", "test", settings);
}

// ---- settings ----

bool test_parse_size_suffixes(TestContext&) {
  check_eq(SettingsManager::parse_size("4096"), 4096ull, "plain");
  check_eq(SettingsManager::parse_size("64K"), 65536ull, "K");
  check_eq(SettingsManager::parse_size("4m"), 4194304ull, "m");
  check_eq(SettingsManager::parse_size("1GB"), 1073741824ull, "GB");
  check_eq(SettingsManager::parse_size(" 2M "), 2097152ull, "trimmed");
  check_eq(SettingsManager::parse_size("17179869183G"), 17179869183ull * 1073741824ull, "largest G");
  check_eq(SettingsManager::parse_size("18446744073709551615"), 18446744073709551615ull, "largest plain");
  for(const char* bad : {"", "M", "1.5M", "-4", "4X", "lots",
                         "17179869184G", "17179869185G", "18014398509481984K",
                         "18446744073709551616", "99999999999999999999"}) {
    bool threw = false;
    try {
      SettingsManager::parse_size(bad);
    } catch(const std::invalid_argument&) {
      threw = true;
    }
    check(threw, std::string("rejects '") + bad + "'");
  }
  return true;
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  check_eq(settings.get<uint64_t>("buffer_size"), 4194304ull, "buffer default");
  check_eq(settings.get<int>("max_tries"), 100, "max_tries default");
  check_eq(settings.get<int>("retry_delay_ms"), 10, "delay default");
  check_eq(settings.get<std::string>("direction"), std::string("push"), "direction default");
  check(!settings.get<bool>("overwrite"), "overwrite default");
  auto missing = settings.missing_required();
  check(missing == std::vector<std::string>{"source", "destination"}, "required positionals");

  SettingsManager agent(RCOPYD_SETTINGS_SPECIFICATION, "rcopyd.json");
  check_eq(agent.get<int>("listen_port"), 9300, "agent port");
  check_eq(agent.settings_path().filename().string(), std::string("rcopyd.json"), "agent file");
  check(!agent.has("buffer_size"), "agent table is separate");
  return true;
}

bool test_value_validation(TestContext&) {
  SettingsManager settings;
  std::string error;
  check(!settings.set_from_string("direction", "sideways", error), "choice rejected");
  check(error.find("push") != std::string::npos, "choices listed");
  check(settings.set_from_string("direction", "PULL", error), "choice case-insensitive");
  check_eq(settings.get<std::string>("direction"), std::string("pull"), "choice stored lowercase");

  check(!settings.set_from_string("max_tries", "0", error), "min rejected");
  check(!settings.set_from_string("buffer_size", "0", error), "zero buffer rejected");
  check(!settings.set_from_string("progress_meter_size", "5", error), "meter min");
  check(!settings.set_from_string("port", "many", error), "int rejected");
  check(settings.set_from_string("buffer_size", "64K", error), "size accepted");
  check_eq(settings.get<uint64_t>("buffer_size"), 65536ull, "size stored");
  return true;
}

bool test_save_and_load(TestContext&) {
  TempWorkspace ws("settings_file");
  SettingsManager settings;
  std::string error;
  settings.set_from_string("source", "a.txt", error);
  settings.set_from_string("max_tries", "7", error);
  settings.set_from_string("host", "backup.lan", error);
  check(settings.save_to_file(ws / "rcopy.json"), "saved");

  auto saved = nlohmann::json::parse(read_text(ws / "rcopy.json"));
  check(!saved.contains("source"), "source is not persistent");

  SettingsManager loaded;
  check(loaded.load_from_file(ws / "rcopy.json"), "loaded");
  check_eq(loaded.get<int>("max_tries"), 7, "max_tries restored");
  check_eq(loaded.get<std::string>("host"), std::string("backup.lan"), "host restored");
  check_eq(loaded.get<std::string>("source"), std::string(), "source left at default");
  return true;
}

// ---- command line ----

bool test_positionals_and_options(TestContext&) {
  SettingsManager settings;
  auto parser = parser_for(settings);
  parser.parse({"photos", "backup/photos", "--direction=pull", "-f", "-bs", "1M", "--tries", "3", "-o", "false"},
               settings);
  check_eq(settings.get<std::string>("source"), std::string("photos"), "source");
  check_eq(settings.get<std::string>("destination"), std::string("backup/photos"), "destination");
  check_eq(settings.get<std::string>("direction"), std::string("pull"), "direction");
  check(settings.get<bool>("force"), "bare bool flag");
  check(!settings.get<bool>("overwrite"), "explicit bool value");
  check_eq(settings.get<uint64_t>("buffer_size"), 1048576ull, "size option");
  check_eq(settings.get<int>("max_tries"), 3, "alias option");
  return true;
}

bool test_command_line_errors(TestContext&) {
  {
    SettingsManager settings;
    auto message = expect_command_line_error([&]{ parser_for(settings).parse({"only-source"}, settings); },
                                             "missing destination");
    check(message.find("destination") != std::string::npos, "names the missing argument");
  }
  {
    SettingsManager settings;
    expect_command_line_error([&]{ parser_for(settings).parse({"a", "b", "c"}, settings); }, "extra positional");
  }
  {
    SettingsManager settings;
    expect_command_line_error([&]{ parser_for(settings).parse({"a", "b", "--bogus"}, settings); }, "unknown");
  }
  {
    SettingsManager settings;
    expect_command_line_error([&]{ parser_for(settings).parse({"a", "b", "--direction", "up"}, settings); },
                              "bad choice");
  }
  {
    SettingsManager settings;
    expect_command_line_error([&]{ parser_for(settings).parse({"a", "b", "--buffer_size"}, settings); },
                              "missing value");
  }
  {
    SettingsManager settings;
    parser_for(settings).parse({"-h"}, settings);
    check(settings.help_requested(), "help skips the required check");
  }
  return true;
}

// ---- progress meter ----

bool test_progress_meter_format(TestContext&) {
  check_eq(ProgressMeter::format_meter(0, 100, 10), std::string("[          ] 0.0%"), "empty");
  check_eq(ProgressMeter::format_meter(100, 100, 10), std::string("[##########] 100.0%"), "full");
  check_eq(ProgressMeter::format_meter(0, 0, 4), std::string("[####] 100.0%"), "zero-length file");
  check_eq(ProgressMeter::format_meter(50, 100, 10), std::string("[#####     ] 50.0%"), "half");
  auto partial = ProgressMeter::format_meter(55, 100, 10);
  check_eq(partial.substr(0, 7), std::string("[#####Y"), "ramp glyph for a partial slot");
  check_eq(ProgressMeter::format_meter(500, 100, 10), ProgressMeter::format_meter(100, 100, 10), "clamped");

  check_eq(ProgressMeter::format_duration_compact(1500ms), std::string("1.5s"), "seconds");
  check_eq(ProgressMeter::format_duration_compact(std::chrono::minutes(2)), std::string("2.0m"), "minutes");
  return true;
}

bool test_progress_meter_lines(TestContext&) {
  std::ostringstream out;
  ProgressMeter meter(60, out);
  TransferProgress progress;
  progress.source_file = "/src/a.bin";
  progress.destination_file = "/dst/a.bin";
  progress.total_bytes = 200;
  for(uint64_t done : {0, 100, 200}) {
    progress.bytes_transferred = done;
    meter.update(progress);
  }
  meter.finish();
  auto text = out.str();
  check(text.find('\r') != std::string::npos, "line rewritten in place");
  check(text.find("a.bin") != std::string::npos, "file named");
  check(text.find("100.0%") != std::string::npos, "completed");
  check(!text.empty() && text.back() == '\n', "line settled");
  return true;
}

// ---- copy session ----

std::shared_ptr<SettingsManager> session_settings(const std::vector<std::string>& args) {
  auto settings = std::make_shared<SettingsManager>();
  parser_for(*settings).parse(args, *settings);
  return settings;
}

CopySession::Options quiet_options(const fs::path& root) {
  CopySession::Options options;
  options.workspace_root = root;
  options.progress_out = nullptr;
  return options;
}

bool test_session_push_through_loopback(TestContext& ctx) {
  TempWorkspace ws("session_push");
  write_file(ws / "work" / "docs" / "readme.txt", std::string("read me"));
  write_file(ws / "work" / "docs" / "img" / "p.bin", make_pattern(5000));
  ws.make_dir("agent");
  auto settings = session_settings({"docs", "copy", "--remote_root", (ws / "agent").string(), "-bs", "1K"});
  CopySession session(settings, quiet_options(ws / "work"));
  ctx.logs.attach(session.logger());
  check_eq(session.run(), static_cast<int>(CopySession::kExitOk), "exit code");
  check_eq(read_text(ws / "agent" / "copy" / "readme.txt"), std::string("read me"), "pushed");
  check(read_file(ws / "agent" / "copy" / "img" / "p.bin") == make_pattern(5000), "pushed binary");
  return true;
}

bool test_session_pull_and_retry_settings(TestContext&) {
  TempWorkspace ws("session_pull");
  write_file(ws / "agent" / "data.csv", std::string("1,2,3\n"));
  ws.make_dir("work");
  auto settings = session_settings({"data.csv", "in/data.csv", "--direction", "pull", "--force",
                                    "--rr", (ws / "agent").string(), "--tries", "4", "--delay", "25"});
  CopySession session(settings, quiet_options(ws / "work"));
  auto policy = session.make_retry_policy();
  check_eq(policy.max_tries(), 4u, "tries from settings");
  check_eq(policy.retry_delay().count(), 25, "delay from settings");
  auto request = session.make_request();
  check(request.direction == TransferDirection::Pull, "direction");
  check(request.force_create_parents, "force");

  auto summary = session.execute();
  check_eq(summary.files_copied, 1u, "one file");
  check_eq(read_text(ws / "work" / "in" / "data.csv"), std::string("1,2,3\n"), "pulled");
  return true;
}

bool test_session_exit_codes(TestContext&) {
  TempWorkspace ws("session_codes");
  ws.make_dir("agent");
  write_file(ws / "work" / "tree" / "a.txt", std::string("a"));
  write_file(ws / "work" / "tree" / "b.txt", std::string("b"));
  const auto agent_root = (ws / "agent").string();

  {
    auto settings = session_settings({"nothing-here", "x", "--rr", agent_root});
    CopySession session(settings, quiet_options(ws / "work"));
    check_eq(session.run(), static_cast<int>(CopySession::kExitFailed), "missing source");
  }
  {
    // b.txt already exists on the agent and overwrite is off
    write_file(ws / "agent" / "out" / "b.txt", std::string("old"));
    auto settings = session_settings({"tree", "out", "--rr", agent_root});
    CopySession session(settings, quiet_options(ws / "work"));
    check_eq(session.run(), static_cast<int>(CopySession::kExitPartial), "partial tree");
    check_eq(read_text(ws / "agent" / "out" / "a.txt"), std::string("a"), "rest copied");
    check_eq(read_text(ws / "agent" / "out" / "b.txt"), std::string("old"), "existing kept");
  }
  {
    auto settings = session_settings({"tree", "cancelled", "--rr", agent_root});
    CopySession session(settings, quiet_options(ws / "work"));
    session.cancel();
    check_eq(session.run(), static_cast<int>(CopySession::kExitAborted), "cancelled tree");
    check(!fs::exists(ws / "agent" / "cancelled" / "a.txt"), "nothing copied");
  }
  {
    auto settings = session_settings({"tree", "again", "--rr", agent_root, "--host", "127.0.0.1", "--port", "1"});
    CopySession session(settings, quiet_options(ws / "work"));
    check_eq(session.run(), static_cast<int>(CopySession::kExitFailed), "unreachable agent");
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"parse_size_suffixes", test_parse_size_suffixes},
    {"defaults", test_defaults},
    {"value_validation", test_value_validation},
    {"save_and_load", test_save_and_load},
    {"positionals_and_options", test_positionals_and_options},
    {"command_line_errors", test_command_line_errors},
    {"progress_meter_format", test_progress_meter_format},
    {"progress_meter_lines", test_progress_meter_lines},
    {"session_push_through_loopback", test_session_push_through_loopback},
    {"session_pull_and_retry_settings", test_session_pull_and_retry_settings},
    {"session_exit_codes", test_session_exit_codes},
  };
  return run_tests("settings", std::move(tests), argc, argv);
}
