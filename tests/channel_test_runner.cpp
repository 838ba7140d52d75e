#include "agent_server.hpp"
#include "local_file_system.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "remote_agent.hpp"
#include "remote_channel.hpp"
#include "remote_file_system.hpp"
#include "tcp_channel.hpp"
#include "test_runner_utils.hpp"
#include "transfer_orchestrator.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rcopy::test;
using namespace std::chrono_literals;

namespace {

// Passes requests through until fail_when matches one, which then surfaces as
// a lost channel.
class FaultingChannel : public RemoteChannel {
public:
  explicit FaultingChannel(std::shared_ptr<RemoteChannel> inner) : inner_(std::move(inner)) {}

  std::function<bool(const json&)> fail_when;

  std::string describe() const override { return "faulting(" + inner_->describe() + ")"; }

  json execute(const json& request) override {
    if(fail_when && fail_when(request)) {
      throw TransferError(TransferErrorCode::ChannelFault, "simulated disconnect");
    }
    return inner_->execute(request);
  }

private:
  std::shared_ptr<RemoteChannel> inner_;
};

// Answers every request with the same canned response.
class CannedChannel : public RemoteChannel {
public:
  explicit CannedChannel(json response) : response_(std::move(response)) {}
  std::string describe() const override { return "canned"; }
  json execute(const json&) override { return response_; }

private:
  json response_;
};

json with_id(json request, uint64_t id = 7) {
  request["id"] = id;
  return request;
}

template<typename Fn>
TransferErrorCode expect_error(Fn&& fn, const std::string& what) {
  try {
    fn();
  } catch(const TransferError& e) {
    return e.code();
  }
  throw CheckFailed(what + ": no error raised");
}

std::string fault_of(const json& response) {
  return response.value("fault", std::string());
}

std::string name_of(TransferErrorCode code) {
  return error_code_name(code);
}

// ---- agent request handling ----

bool test_hello_reports_root(TestContext&) {
  TempWorkspace ws("hello");
  RemoteAgent agent(ws.root());
  auto response = agent.handle(with_id(make_hello_request()));
  check(response.value("ok", false), "hello ok");
  check_eq(response.value("id", 0), 7, "id echoed");
  check_eq(response.value("agent", std::string()), std::string("rcopyd"), "agent name");
  check_eq(response.value("root", std::string()), agent.root().string(), "root");
  check_eq(response.value("max_write", std::size_t{0}), kMaxWriteLength, "write limit advertised");
  return true;
}

bool test_stat_and_list(TestContext&) {
  TempWorkspace ws("stat_list");
  write_file(ws / "dir" / "file.bin", make_pattern(123));
  ws.make_dir("dir/sub");
  fs::create_symlink("file.bin", ws / "dir" / "link");
  auto channel = std::make_shared<LoopbackChannel>(ws.root());
  RemoteFileSystem remote(channel);

  auto info = remote.stat("dir/file.bin");
  check(info.has_value(), "file exists");
  check(info->kind == EntryKind::File, "file kind");
  check_eq(info->size, 123ull, "file size");
  check(!remote.stat("dir/none").has_value(), "missing entry");
  check(remote.is_directory("dir"), "directory");

  auto entries = remote.list_entries("dir");
  check_eq(entries.size(), 3u, "entry count");
  std::sort(entries.begin(), entries.end(),
            [](const EntryInfo& a, const EntryInfo& b){ return a.name < b.name; });
  check(entries[0].name == "file.bin" && entries[0].kind == EntryKind::File, "file entry");
  check(entries[1].name == "link" && entries[1].kind == EntryKind::Symlink, "symlink entry");
  check(entries[2].name == "sub" && entries[2].kind == EntryKind::Directory, "dir entry");
  return true;
}

bool test_raw_byte_names_on_the_wire(TestContext&) {
  TempWorkspace ws("raw_names");
  const std::string latin1 = "caf\xe9.txt";
  const std::string utf8 = "caf\xc3\xa9.txt";
  write_file(ws / "dir" / latin1, std::string("latin1"));
  write_file(ws / "dir" / utf8, std::string("utf8"));
  RemoteAgent agent(ws.root());

  auto response = agent.handle(with_id(make_list_request((ws / "dir").string())));
  check(response.value("ok", false), "list ok");
  std::string line;
  try {
    line = response.dump();
  } catch(const json::exception& e) {
    throw CheckFailed(std::string("list response does not serialize: ") + e.what());
  }
  auto entries = json::parse(line).at("entries");
  check_eq(entries.size(), 2u, "entry count");
  std::vector<std::string> names;
  for(const auto& entry : entries) names.push_back(entry_from_json(entry).name);
  std::sort(names.begin(), names.end());
  check(names[0] == utf8 && names[1] == latin1, "names byte exact");

  check(path_to_json(utf8).is_string(), "valid UTF-8 stays a string");
  check(path_to_json(latin1).is_object(), "invalid UTF-8 is encoded");
  check(path_from_json(path_to_json(latin1)) == latin1, "encoded path decodes");

  auto stat = agent.handle(with_id(make_stat_request((ws / "dir" / latin1).string())));
  check(stat.value("exists", false), "stat through encoded path");
  check_eq(stat.value("size", uint64_t{0}), 6ull, "stat size");

  auto missing = agent.handle(with_id(make_resolve_request((ws / "dir" / latin1 / "x").string())));
  check_eq(fault_of(missing), name_of(TransferErrorCode::SourceNotFound), "resolve fault");
  check(path_from_json(missing.at("closest")) == (ws / "dir" / latin1).string(), "closest keeps raw bytes");

  auto bad = agent.handle(with_id(json{{"v", kProtocolVersion}, {"op", op::kStat}, {"path", {{"b64", "%%%"}}}}));
  check_eq(fault_of(bad), name_of(TransferErrorCode::ProtocolError), "malformed encoded path");
  return true;
}

bool test_resolve_reports_closest(TestContext&) {
  TempWorkspace ws("resolve");
  ws.make_dir("a");
  auto channel = std::make_shared<LoopbackChannel>(ws.root());
  RemoteFileSystem remote(channel);
  check_eq(remote.resolve_absolute("a"), remote.root() / "a", "existing resolves");
  try {
    remote.resolve_absolute("a/missing/x");
  } catch(const PathNotFound& e) {
    check(e.code() == TransferErrorCode::SourceNotFound, "code");
    check_eq(e.closest_existing(), remote.root() / "a", "closest existing");
    return true;
  }
  throw CheckFailed("PathNotFound not raised");
}

bool test_mkdir_reports_created(TestContext&) {
  TempWorkspace ws("mkdir");
  auto channel = std::make_shared<LoopbackChannel>(ws.root());
  RemoteFileSystem remote(channel);
  check(remote.make_directories("x/y/z"), "created chain");
  check(fs::is_directory(ws / "x" / "y" / "z"), "on disk");
  check(!remote.make_directories("x/y"), "already present");
  return true;
}

bool test_bad_requests_become_faults(TestContext&) {
  TempWorkspace ws("bad_requests");
  RemoteAgent agent(ws.root());

  json unknown = {{"v", kProtocolVersion}, {"op", "format_disk"}};
  check_eq(fault_of(agent.handle(unknown)), name_of(TransferErrorCode::InvalidRequest), "unknown op");

  json future = {{"v", kProtocolVersion + 1}, {"op", "hello"}};
  check_eq(fault_of(agent.handle(future)), name_of(TransferErrorCode::ProtocolError), "version");

  check_eq(fault_of(agent.handle(json::array({1, 2}))), name_of(TransferErrorCode::ProtocolError), "non-object");

  json no_path = {{"v", kProtocolVersion}, {"op", "stat"}};
  check_eq(fault_of(agent.handle(no_path)), name_of(TransferErrorCode::InvalidRequest), "missing path");

  check_eq(fault_of(agent.handle(with_id(make_write_request(99, "x", 1)))),
           name_of(TransferErrorCode::InvalidRequest), "unknown handle");

  json garbage = with_id(make_write_request(0, "x", 1));
  auto opened = agent.handle(with_id(make_open_write_request("f", WriteMode::Create, false)));
  garbage["handle"] = opened.at("handle");
  garbage["data"] = "***";
  check_eq(fault_of(agent.handle(garbage)), name_of(TransferErrorCode::InvalidRequest), "bad base64");
  return true;
}

bool test_write_handle_lifecycle(TestContext&) {
  TempWorkspace ws("handles");
  RemoteAgent agent(ws.root());
  auto opened = agent.handle(with_id(make_open_write_request("out.txt", WriteMode::Create, false)));
  check(opened.value("ok", false), "open ok");
  auto handle = opened.at("handle").get<uint64_t>();
  check_eq(agent.open_handles(), 1u, "one handle");

  auto first = agent.handle(with_id(make_write_request(handle, "hello ", 6)));
  check_eq(first.value("size", uint64_t{0}), uint64_t{6}, "cumulative size");
  auto second = agent.handle(with_id(make_write_request(handle, "world", 5)));
  check_eq(second.value("size", uint64_t{0}), uint64_t{11}, "cumulative size");

  check(agent.handle(with_id(make_close_request(handle))).value("ok", false), "close ok");
  check_eq(agent.open_handles(), 0u, "handle released");
  check_eq(read_text(ws / "out.txt"), std::string("hello world"), "content");
  check_eq(fault_of(agent.handle(with_id(make_close_request(handle)))),
           name_of(TransferErrorCode::InvalidRequest), "double close");

  auto again = agent.handle(with_id(make_open_write_request("out.txt", WriteMode::Create, false)));
  check_eq(fault_of(again), name_of(TransferErrorCode::DestinationExists), "no overwrite");
  return true;
}

bool test_open_handle_holds_lock(TestContext&) {
  TempWorkspace ws("agent_lock");
  RemoteAgent first(ws.root());
  RemoteAgent second(ws.root());
  auto held = first.handle(with_id(make_open_write_request("busy", WriteMode::Create, true)));
  check(held.value("ok", false), "first open");
  auto blocked = second.handle(with_id(make_open_write_request("busy", WriteMode::Create, true)));
  check_eq(fault_of(blocked), name_of(TransferErrorCode::Locked), "second open locked");
  first.close_all();
  auto freed = second.handle(with_id(make_open_write_request("busy", WriteMode::Create, true)));
  check(freed.value("ok", false), "open after release");
  return true;
}

bool test_read_is_capped(TestContext&) {
  TempWorkspace ws("read_cap");
  auto data = make_pattern(kMaxReadLength + 10, 4);
  write_file(ws / "big.bin", data);
  RemoteAgent agent(ws.root());

  auto head = agent.handle(with_id(make_read_request("big.bin", 0, 4 * kMaxReadLength)));
  auto head_bytes = base64_decode(head.at("data").get<std::string>());
  check_eq(head_bytes.size(), kMaxReadLength, "capped read");
  check(!head.value("eof", true), "not at eof");
  check(std::equal(head_bytes.begin(), head_bytes.end(), data.begin()), "head bytes");

  auto tail = agent.handle(with_id(make_read_request("big.bin", kMaxReadLength, kMaxReadLength)));
  auto tail_bytes = base64_decode(tail.at("data").get<std::string>());
  check_eq(tail_bytes.size(), 10u, "tail size");
  check(tail.value("eof", false), "eof after tail");

  auto past = agent.handle(with_id(make_read_request("big.bin", kMaxReadLength + 10, 16)));
  check(past.at("data").get<std::string>().empty(), "nothing past the end");
  check(past.value("eof", false), "eof past the end");

  auto missing = agent.handle(with_id(make_read_request("nope.bin", 0, 16)));
  check_eq(fault_of(missing), name_of(TransferErrorCode::SourceNotFound), "missing read");
  return true;
}

bool test_response_checks(TestContext&) {
  CannedChannel wrong_id(json{{"v", kProtocolVersion}, {"id", 999999}, {"ok", true}});
  auto code = expect_error([&]{ wrong_id.call(make_hello_request()); }, "id mismatch");
  check(code == TransferErrorCode::ProtocolError, "id mismatch is a protocol error");

  CannedChannel not_object(json::array());
  code = expect_error([&]{ not_object.call(make_hello_request()); }, "non-object response");
  check(code == TransferErrorCode::ProtocolError, "non-object response");

  json request = with_id(make_stat_request("/x"), 3);
  json unknown_fault = {{"v", kProtocolVersion}, {"id", 3}, {"ok", false}, {"fault", "meltdown"}};
  code = expect_error([&]{ check_response(request, unknown_fault); }, "unknown fault");
  check(code == TransferErrorCode::ProtocolError, "unknown fault name");

  json locked = {{"v", kProtocolVersion}, {"id", 3}, {"ok", false}, {"fault", "locked"}, {"error", "busy"}};
  code = expect_error([&]{ check_response(request, locked); }, "locked fault");
  check(code == TransferErrorCode::Locked, "fault name mapped back");
  return true;
}

// ---- channel loss ----

bool test_channel_fault_during_pull(TestContext&) {
  TempWorkspace ws("pull_fault");
  auto remote_root = ws.make_dir("remote");
  auto local_root = ws.make_dir("local");
  for(const char* name : {"a.txt", "b.txt", "c.txt"}) {
    write_file(remote_root / "tree" / name, std::string(name));
  }
  auto faulting = std::make_shared<FaultingChannel>(std::make_shared<LoopbackChannel>(remote_root));
  faulting->fail_when = [](const json& request) {
    return request.value("op", std::string()) == op::kRead &&
           fs::path(request.value("path", std::string())).filename() == "b.txt";
  };
  RemoteFileSystem remote(faulting);
  LocalFileSystem local(local_root);
  TransferOrchestrator orchestrator(local, remote);

  TransferRequest request;
  request.source_path = "tree";
  request.destination_path = local_root / "tree";
  request.direction = TransferDirection::Pull;
  try {
    orchestrator.copy(request);
  } catch(const AbortedTransfer& e) {
    check(e.code() == TransferErrorCode::ChannelFault, "cause");
    check_eq(e.completed().files_copied, 1u, "completed before loss");
    check_eq(read_text(local_root / "tree" / "a.txt"), std::string("a.txt"), "a copied");
    check(!fs::exists(local_root / "tree" / "c.txt"), "queue stopped");
    return true;
  }
  throw CheckFailed("AbortedTransfer not raised");
}

bool test_channel_fault_single_file(TestContext&) {
  TempWorkspace ws("push_fault");
  auto remote_root = ws.make_dir("remote");
  auto local_root = ws.make_dir("local");
  write_file(local_root / "f.bin", make_pattern(200));
  auto faulting = std::make_shared<FaultingChannel>(std::make_shared<LoopbackChannel>(remote_root));
  faulting->fail_when = [](const json& request) {
    return request.value("op", std::string()) == op::kWrite;
  };
  RemoteFileSystem remote(faulting);
  LocalFileSystem local(local_root);
  TransferOrchestrator orchestrator(local, remote);
  TransferRequest request;
  request.source_path = local_root / "f.bin";
  request.destination_path = "f.bin";
  auto code = expect_error([&]{ orchestrator.copy(request); }, "lost write");
  check(code == TransferErrorCode::ChannelFault, "ChannelFault propagates as is");
  return true;
}

// ---- TCP ----

AgentServer::Options server_options(const fs::path& root) {
  AgentServer::Options options;
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  options.root = root;
  return options;
}

bool test_tcp_push_pull_round_trip(TestContext& ctx) {
  TempWorkspace ws("tcp_round_trip");
  auto remote_root = ws.make_dir("remote");
  auto local_root = ws.make_dir("local");
  auto server_logger = std::make_shared<Logger>("rcopyd");
  ctx.logs.attach(server_logger, "server");
  AgentServer server(server_options(remote_root), server_logger);
  server.start_background();
  check(server.listen_port() != 0, "bound port");

  auto data = make_pattern(3 * 1024 * 1024 + 17, 21);
  write_file(local_root / "tree" / "big.bin", data);
  write_file(local_root / "tree" / "sub" / "small.txt", std::string("small"));

  {
    auto channel = std::make_shared<TcpChannel>("127.0.0.1", server.listen_port());
    RemoteFileSystem remote(channel);
    LocalFileSystem local(local_root);
    TransferOrchestrator orchestrator(local, remote);

    TransferRequest up;
    up.source_path = local_root / "tree";
    up.destination_path = "mirror";
    up.buffer_size_bytes = 1024 * 1024;
    auto pushed = orchestrator.copy(up);
    check_eq(pushed.files_copied, 2u, "pushed files");
    check(read_file(remote_root / "mirror" / "big.bin") == data, "pushed bytes");
    check(wait_for_condition([&]{ return server.session_count() == 1; }, 2s), "one session");

    TransferRequest down;
    down.source_path = "mirror";
    down.destination_path = local_root / "back";
    down.direction = TransferDirection::Pull;
    down.buffer_size_bytes = 512 * 1024;
    auto pulled = orchestrator.copy(down);
    check_eq(pulled.bytes_copied, static_cast<uint64_t>(data.size() + 5), "pulled bytes");
    check(read_file(local_root / "back" / "big.bin") == data, "pulled content");
    check_eq(read_text(local_root / "back" / "sub" / "small.txt"), std::string("small"), "pulled small");
  }

  check(wait_for_condition([&]{ return server.session_count() == 0; }, 2s), "session closed");
  server.stop();
  return true;
}

bool test_tcp_raw_byte_names(TestContext&) {
  TempWorkspace ws("tcp_raw_names");
  auto remote_root = ws.make_dir("remote");
  auto local_root = ws.make_dir("local");
  AgentServer server(server_options(remote_root));
  server.start_background();

  const std::string name = "caf\xe9.txt";
  const std::string dir = "d\xff";
  auto data = make_pattern(5000, 9);
  write_file(local_root / "tree" / name, data);
  write_file(local_root / "tree" / dir / "inner.txt", std::string("inner"));

  auto channel = std::make_shared<TcpChannel>("127.0.0.1", server.listen_port());
  RemoteFileSystem remote(channel);
  LocalFileSystem local(local_root);
  TransferOrchestrator orchestrator(local, remote);

  TransferRequest up;
  up.source_path = local_root / "tree";
  up.destination_path = "mirror";
  up.buffer_size_bytes = 1024;
  auto pushed = orchestrator.copy(up);
  check_eq(pushed.files_copied, 2u, "pushed files");
  check(read_file(remote_root / "mirror" / name) == data, "pushed under the raw name");
  check_eq(read_text(remote_root / "mirror" / dir / "inner.txt"), std::string("inner"), "raw directory name");

  TransferRequest down;
  down.source_path = "mirror";
  down.destination_path = local_root / "back";
  down.direction = TransferDirection::Pull;
  down.buffer_size_bytes = 700;
  auto pulled = orchestrator.copy(down);
  check_eq(pulled.files_copied, 2u, "pulled files");
  check(read_file(local_root / "back" / name) == data, "pulled under the raw name");
  check_eq(read_text(local_root / "back" / dir / "inner.txt"), std::string("inner"), "pulled raw directory");

  // a fault whose message quotes the name still reaches the client
  TransferRequest again;
  again.source_path = local_root / "tree" / name;
  again.destination_path = "mirror/" + name;
  again.buffer_size_bytes = 1024;
  auto code = expect_error([&]{ orchestrator.copy(again); }, "existing raw name");
  check(code == TransferErrorCode::DestinationExists, "DestinationExists expected");
  check(channel->is_open(), "channel still open");
  check(remote.exists("mirror/" + name), "session still answers");

  channel->close();
  server.stop();
  return true;
}

bool test_tcp_write_limit_boundary(TestContext&) {
  TempWorkspace ws("tcp_write_limit");
  auto remote_root = ws.make_dir("remote");
  auto local_root = ws.make_dir("local");
  AgentServer server(server_options(remote_root));
  server.start_background();

  auto data = make_pattern(kMaxWriteLength + 5, 13);
  write_file(local_root / "big.bin", data);

  auto channel = std::make_shared<TcpChannel>("127.0.0.1", server.listen_port());
  RemoteFileSystem remote(channel);
  check(remote.max_write_size() == kMaxWriteLength, "limit from hello");
  LocalFileSystem local(local_root);
  TransferOrchestrator orchestrator(local, remote);

  TransferRequest over;
  over.source_path = local_root / "big.bin";
  over.destination_path = "over.bin";
  over.buffer_size_bytes = kMaxWriteLength + 1;
  auto code = expect_error([&]{ orchestrator.copy(over); }, "buffer over the limit");
  check(code == TransferErrorCode::InvalidRequest, "InvalidRequest, not a lost channel");
  check(channel->is_open(), "channel still open");
  check(!fs::exists(remote_root / "over.bin"), "nothing opened");

  TransferRequest at;
  at.source_path = local_root / "big.bin";
  at.destination_path = "at.bin";
  at.buffer_size_bytes = kMaxWriteLength;
  auto summary = orchestrator.copy(at);
  check_eq(summary.bytes_copied, static_cast<uint64_t>(data.size()), "bytes at the limit");
  check(read_file(remote_root / "at.bin") == data, "content at the limit");
  check_eq(server.session_count(), 1u, "session kept");

  channel->close();
  server.stop();
  return true;
}

bool test_tcp_disconnect_releases_handles(TestContext&) {
  TempWorkspace ws("tcp_release");
  AgentServer server(server_options(ws.root()));
  server.start_background();

  auto holder = std::make_shared<TcpChannel>("127.0.0.1", server.listen_port());
  RemoteFileSystem holder_fs(holder);
  auto sink = holder_fs.open_for_write("held.bin", WriteMode::Create, false);

  auto other = std::make_shared<TcpChannel>("127.0.0.1", server.listen_port());
  RemoteFileSystem other_fs(other);
  auto code = expect_error([&]{ other_fs.open_for_write("held.bin", WriteMode::Create, true); }, "held");
  check(code == TransferErrorCode::Locked, "locked while held");

  holder->close();
  check(wait_for_condition([&]{ return server.session_count() == 1; }, 2s), "holder session gone");
  auto reopened = other_fs.open_for_write("held.bin", WriteMode::Create, true);
  reopened->write("ok", 2);
  reopened->close();
  check_eq(read_text(ws / "held.bin"), std::string("ok"), "written after release");
  sink.reset();
  server.stop();
  return true;
}

bool test_tcp_server_stop_is_channel_fault(TestContext&) {
  TempWorkspace ws("tcp_stop");
  AgentServer server(server_options(ws.root()));
  server.start_background();
  auto channel = std::make_shared<TcpChannel>("127.0.0.1", server.listen_port());
  RemoteFileSystem remote(channel);
  check(!remote.exists("nothing"), "probe before stop");
  server.stop();
  auto code = expect_error([&]{ remote.stat("nothing"); }, "after stop");
  check(code == TransferErrorCode::ChannelFault, "ChannelFault after stop");
  check(!channel->is_open(), "channel broken");
  code = expect_error([&]{ remote.stat("nothing"); }, "broken channel");
  check(code == TransferErrorCode::ChannelFault, "stays broken");
  return true;
}

bool test_tcp_connect_refused(TestContext&) {
  TempWorkspace ws("tcp_refused");
  uint16_t port = 0;
  {
    AgentServer server(server_options(ws.root()));
    server.start();
    port = server.listen_port();
    server.stop();
  }
  auto code = expect_error([&]{ TcpChannel channel("127.0.0.1", port); }, "refused");
  check(code == TransferErrorCode::ChannelFault, "ChannelFault on connect");
  return true;
}

bool test_tcp_unparseable_line(TestContext&) {
  TempWorkspace ws("tcp_garbage");
  AgentServer server(server_options(ws.root()));
  server.start_background();

  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server.listen_port()));
  std::string line = "this is not json\n";
  asio::write(socket, asio::buffer(line));
  asio::streambuf buf;
  asio::read_until(socket, buf, '\n');
  std::istream in(&buf);
  std::string reply;
  std::getline(in, reply);
  auto response = json::parse(reply);
  check(!response.value("ok", true), "fault response");
  check_eq(fault_of(response), name_of(TransferErrorCode::ProtocolError), "fault name");

  // the session survives a bad line
  std::string hello = with_id(make_hello_request(), 1).dump() + "\n";
  asio::write(socket, asio::buffer(hello));
  asio::read_until(socket, buf, '\n');
  std::getline(in, reply);
  check(json::parse(reply).value("ok", false), "hello after garbage");

  socket.close();
  server.stop();
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"hello_reports_root", test_hello_reports_root},
    {"stat_and_list", test_stat_and_list},
    {"raw_byte_names_on_the_wire", test_raw_byte_names_on_the_wire},
    {"resolve_reports_closest", test_resolve_reports_closest},
    {"mkdir_reports_created", test_mkdir_reports_created},
    {"bad_requests_become_faults", test_bad_requests_become_faults},
    {"write_handle_lifecycle", test_write_handle_lifecycle},
    {"open_handle_holds_lock", test_open_handle_holds_lock},
    {"read_is_capped", test_read_is_capped},
    {"response_checks", test_response_checks},
    {"channel_fault_during_pull", test_channel_fault_during_pull},
    {"channel_fault_single_file", test_channel_fault_single_file},
    {"tcp_push_pull_round_trip", test_tcp_push_pull_round_trip},
    {"tcp_raw_byte_names", test_tcp_raw_byte_names},
    {"tcp_write_limit_boundary", test_tcp_write_limit_boundary},
    {"tcp_disconnect_releases_handles", test_tcp_disconnect_releases_handles},
    {"tcp_server_stop_is_channel_fault", test_tcp_server_stop_is_channel_fault},
    {"tcp_connect_refused", test_tcp_connect_refused},
    {"tcp_unparseable_line", test_tcp_unparseable_line},
  };
  return run_tests("channel", std::move(tests), argc, argv);
}
