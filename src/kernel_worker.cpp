#include "kernel_worker.h"

#include "lua_error_formatter.h"
#include "lua_util.h"
#include "rich_output.h"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
}

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <fcntl.h>
#include <unistd.h>

namespace cascade {
namespace {

constexpr char kMessageMagic[4]{ 'C', 'S', 'W', 'M' };
constexpr int kWorkerSetupExit{ 125 };
constexpr int kWorkerWriteExit{ 126 };
constexpr long kMaxInheritedFd{ 65536 };

void put_u32(std::string &out, std::uint32_t v) {
  for (int i{ 0 }; i < 4; ++i) { out.push_back(static_cast<char>((v >> (8 * i)) & 0xff)); }
}

void put_str(std::string &out, std::string_view s) {
  put_u32(out, static_cast<std::uint32_t>(s.size()));
  out.append(s);
}

class message_reader {
 public:
  explicit message_reader(std::string_view in) : in_{ in } {}

  std::uint8_t u8() {
    need(1);
    return static_cast<std::uint8_t>(in_[pos_++]);
  }

  std::uint32_t u32() {
    std::uint32_t v{ 0 };
    for (int i{ 0 }; i < 4; ++i) { v |= static_cast<std::uint32_t>(u8()) << (8 * i); }
    return v;
  }

  std::string str() {
    std::uint32_t const size{ u32() };
    need(size);
    std::string s{ in_.substr(pos_, size) };
    pos_ += size;
    return s;
  }

  bool at_end() const { return pos_ == in_.size(); }

 private:
  void need(std::size_t n) const {
    if (in_.size() - pos_ < n) { throw worker_protocol_error("worker message truncated"); }
  }

  std::string_view in_;
  std::size_t pos_{ 0 };
};

std::string pop_message(lua_State *L) {
  char const *msg{ lua_tostring(L, -1) };
  std::string out{ msg ? msg : "unknown error" };
  lua_pop(L, 1);
  return out;
}

// Turns non-string error objects into text before the stack unwinds.
int message_handler(lua_State *L) {
  if (lua_tostring(L, 1)) { return 1; }
  if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING) { return 1; }
  lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
  return 1;
}

// os.exit replacement: exit() would run the parent's atexit handlers and static
// destructors inside the worker.
int worker_os_exit(lua_State *L) {
  int code{ EXIT_SUCCESS };
  if (lua_isboolean(L, 1)) {
    code = lua_toboolean(L, 1) ? EXIT_SUCCESS : EXIT_FAILURE;
  } else {
    code = static_cast<int>(luaL_optinteger(L, 1, EXIT_SUCCESS));
  }
  std::fflush(stdout);
  std::fflush(stderr);
  _exit(code);
}

bool write_all(int fd, char const *data, std::size_t size) {
  while (size > 0) {
    ssize_t const written{ ::write(fd, data, size) };
    if (written == -1) {
      if (errno == EINTR) { continue; }
      return false;
    }
    size -= static_cast<std::size_t>(written);
    data += written;
  }
  return true;
}

// Descriptors inherited from the parent would keep other workers' pipes open.
void close_inherited_fds(int keep) {
  long const max_fd{ std::min(::sysconf(_SC_OPEN_MAX), kMaxInheritedFd) };
  for (int fd{ STDERR_FILENO + 1 }; fd < max_fd; ++fd) {
    if (fd != keep) { ::close(fd); }
  }
}

}  // namespace

std::string worker_message_encode(worker_message const &message) {
  std::string out(kMessageMagic, sizeof(kMessageMagic));
  out.push_back(message.ok ? 1 : 0);
  out.push_back(static_cast<char>(message.kind));
  put_str(out, message.error);
  put_str(out, message.display);
  out.push_back(message.rich_json ? 1 : 0);
  if (message.rich_json) { put_str(out, *message.rich_json); }
  put_str(out, message.namespace_bytes);
  return out;
}

worker_message worker_message_decode(std::string_view bytes) {
  message_reader r{ bytes };
  for (char const c : kMessageMagic) {
    if (r.u8() != static_cast<std::uint8_t>(c)) {
      throw worker_protocol_error("worker message has a bad header");
    }
  }

  worker_message message;
  message.ok = r.u8() != 0;
  auto const kind{ r.u8() };
  if (kind > static_cast<std::uint8_t>(fault_kind::worker_crash)) {
    throw worker_protocol_error("worker message has an unknown fault kind");
  }
  message.kind = static_cast<fault_kind>(kind);
  message.error = r.str();
  message.display = r.str();
  if (r.u8() != 0) { message.rich_json = r.str(); }
  message.namespace_bytes = r.str();
  if (!r.at_end()) { throw worker_protocol_error("worker message has trailing bytes"); }
  return message;
}

std::string kernel_prepare_source(run_request const &request) {
  auto const &source{ request.source };
  if (!request.trailing_expr_offset || *request.trailing_expr_offset > source.size()) {
    return source;
  }

  auto const offset{ *request.trailing_expr_offset };
  std::string out;
  out.reserve(source.size() + 7);
  out.append(source, 0, offset);
  out += "return ";
  out.append(source, offset, std::string::npos);
  return out;
}

worker_message kernel_worker_execute(run_request const &request,
                                     namespace_store const &ns,
                                     kernel_cfg const &cfg) {
  worker_message message;
  auto const fail{ [&message](fault_kind kind, std::string text) {
    message.ok = false;
    message.kind = kind;
    message.error = std::move(text);
    return message;
  } };

  try {
    auto state{ lua_make() };
    lua_State *L{ state.get() };
    rich_output_install(L);
    lua_getglobal(L, "os");
    lua_pushcfunction(L, worker_os_exit);
    lua_setfield(L, -2, "exit");
    lua_pop(L, 1);
    lua_register_builtins(L);

    lua_push_namespace_env(L, ns);
    int const env{ lua_gettop(L) };
    for (auto const &name : request.retired_symbols) {
      lua_pushlstring(L, name.data(), name.size());
      lua_pushnil(L);
      lua_rawset(L, env);
    }

    auto const source{ kernel_prepare_source(request) };
    std::string const chunk_name{ "=" + request.cell_id };
    if (luaL_loadbufferx(L, source.data(), source.size(), chunk_name.c_str(), "t") !=
        LUA_OK) {
      auto info{ parse_lua_error(pop_message(L), "SyntaxError") };
      info.kind = "SyntaxError";
      return fail(fault_kind::syntax, format_lua_error(info, request.cell_id));
    }
    lua_pushvalue(L, env);
    lua_setupvalue(L, -2, 1);

    lua_pushcfunction(L, message_handler);
    lua_insert(L, -2);
    int const handler{ lua_gettop(L) - 1 };

    if (lua_pcall(L, 0, LUA_MULTRET, handler) != LUA_OK) {
      auto const info{ parse_lua_error(pop_message(L), "RuntimeError") };
      auto const kind{ info.kind == "UnresolvedSymbol" ? fault_kind::unresolved_symbol
                                                       : fault_kind::runtime };
      return fail(kind, format_lua_error(info, request.cell_id));
    }

    int const nresults{ lua_gettop(L) - handler };
    if (nresults > 0 && !(nresults == 1 && lua_isnil(L, -1))) {
      for (int i{ 1 }; i <= nresults; ++i) {
        if (i > 1) { message.display += '\t'; }
        message.display += lua_render_value(L, handler + i);
      }
      if (auto rich{ rich_output_project(L, handler + 1, cfg.rich) }) {
        message.rich_json = rich->serialize();
      }
    }
    lua_settop(L, env);

    message.namespace_bytes = lua_capture_namespace(L, env).encode();
    message.ok = true;
    return message;
  } catch (namespace_capture_error const &e) {
    return fail(fault_kind::namespace_error, e.what());
  } catch (rich_output_error const &e) {
    return fail(fault_kind::runtime, std::string{ "RuntimeError: " } + e.what());
  } catch (std::exception const &e) {
    return fail(fault_kind::worker_crash, std::string{ "WorkerCrash: " } + e.what());
  }
}

void kernel_worker_main(int capture_fd,
                        int result_fd,
                        run_request const &request,
                        namespace_store const &ns,
                        kernel_cfg const &cfg) {
  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1 || ::dup2(null_fd, STDIN_FILENO) == -1 ||
      ::dup2(capture_fd, STDOUT_FILENO) == -1 || ::dup2(capture_fd, STDERR_FILENO) == -1) {
    _exit(kWorkerSetupExit);
  }
  close_inherited_fds(result_fd);

  auto const message{ kernel_worker_execute(request, ns, cfg) };
  std::fflush(stdout);
  std::fflush(stderr);

  auto const bytes{ worker_message_encode(message) };
  if (!write_all(result_fd, bytes.data(), bytes.size())) { _exit(kWorkerWriteExit); }
  ::close(result_fd);
  _exit(0);
}

}  // namespace cascade
