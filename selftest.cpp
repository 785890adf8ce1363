#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <iostream>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <exception>

#if defined(__unix__) || defined(__APPLE__)
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <unistd.h>
  #include <signal.h>
  #include <fcntl.h>
  #include <errno.h>
  #include <poll.h>
#endif

#include "core/defs.hpp"
#include "core/errors.hpp"
#include "core/testcases.hpp"

#include "farfalle/deck.hpp"
#include "farfalle/util.hpp"

namespace fs = std::filesystem;

static const int CLI_TIMEOUT_MS = 10000;

static void write_file(const fs::path& p, const std::string& data) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs.write(data.data(), (std::streamsize)data.size());
}

static std::string now_ms() {
  using namespace std::chrono;
  auto t = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return std::to_string((long long)t);
}

struct RunResult {
  int code = -1;
  std::string out;
  std::string err;
};

static bool g_any_fail = false;
static int  g_fail_count = 0;

static void mark_fail() { g_any_fail = true; g_fail_count++; }

#if defined(__unix__) || defined(__APPLE__)

static bool set_nonblock(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

// Drains fd into dst. Returns false once the write end is closed.
static bool drain(int fd, std::string& dst) {
  for (;;) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) { dst.append(buf, buf + n); continue; }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

static RunResult run_cmd_capture_timed(const std::vector<std::string>& argv, int timeout_ms) {
  RunResult rr;

  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    rr.code = 127;
    rr.err = "pipe failed";
    return rr;
  }
  if (pipe(err_pipe) != 0) {
    close(out_pipe[0]);
    close(out_pipe[1]);
    rr.code = 127;
    rr.err = "pipe failed";
    return rr;
  }

  pid_t pid = fork();
  if (pid == -1) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close(fd);
    rr.code = 127;
    rr.err = "fork failed";
    return rr;
  }

  if (pid == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    execvp(cargv[0], cargv.data());
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  (void)set_nonblock(out_pipe[0]);
  (void)set_nonblock(err_pipe[0]);

  using clock = std::chrono::steady_clock;
  auto start = clock::now();

  bool out_open = true;
  bool err_open = true;
  bool killed = false;

  while (out_open || err_open) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count();
    if (elapsed > timeout_ms) {
      killed = true;
      kill(pid, SIGKILL);
      break;
    }

    struct pollfd fds[2];
    nfds_t nfds = 0;
    if (out_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (err_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};
    int pr = poll(fds, nfds, 50);
    if (pr < 0 && errno != EINTR) break;

    if (out_open) out_open = drain(out_pipe[0], rr.out);
    if (err_open) err_open = drain(err_pipe[0], rr.err);
  }

  close(out_pipe[0]);
  close(err_pipe[0]);

  int status = 0;
  (void)waitpid(pid, &status, 0);

  if (killed) { rr.code = 124; if (rr.err.empty()) rr.err = "timeout"; return rr; }
  if (WIFEXITED(status)) rr.code = WEXITSTATUS(status);
  else rr.code = 128;
  return rr;
}

#else

static RunResult run_cmd_capture_timed(const std::vector<std::string>&, int) {
  RunResult rr;
  rr.err = "unsupported platform for timed runner";
  rr.code = 127;
  return rr;
}

#endif

static void print_banner() {
  std::cout << "KRAVGEN SELFTEST REPORT\n";
  std::cout << "=======================\n\n";

  std::cout << "[Build]\n";
#if defined(__clang__)
  std::cout << "  Compiler: clang/AppleClang\n";
#elif defined(__GNUC__)
  std::cout << "  Compiler: GCC\n";
#elif defined(_MSC_VER)
  std::cout << "  Compiler: MSVC\n";
#else
  std::cout << "  Compiler: unknown\n";
#endif
  std::cout << "  __cplusplus: " << (long long)__cplusplus << "\n";
  std::cout << "  TOOL_NAME: " << kravgen::TOOL_NAME << "\n";
  std::cout << "  CLI_TIMEOUT_MS: " << CLI_TIMEOUT_MS << "\n\n";

  std::cout << "[Params]\n";
  std::cout << "  DEFAULT_KEY: \"" << kravgen::DEFAULT_KEY << "\"\n";
  std::cout << "  DEFAULT_OUT_BYTES: " << (long long)kravgen::DEFAULT_OUT_BYTES << "\n";
  std::cout << "  MAX_KEY_BYTES (Kravatte): "
            << farfalle::KeyedSpongePRF::max_key_bytes(farfalle::Instance::Kravatte) << "\n";
  std::cout << "  MAX_KEY_BYTES (Xoofff): "
            << farfalle::KeyedSpongePRF::max_key_bytes(farfalle::Instance::Xoofff) << "\n";
}

static void print_step(const std::string& name) { std::cout << "\n[" << name << "]\n"; }
static void print_cmd(const std::vector<std::string>& argv) {
  std::cout << "  $";
  for (const auto& a : argv) std::cout << " " << (a.empty() ? "\"\"" : a);
  std::cout << "\n";
}
static void print_ok() { std::cout << "  RESULT: OK\n"; }
static void print_fail(const std::string& why) { std::cout << "  RESULT: FAIL: " << why << "\n"; mark_fail(); }

static std::string first_lines(const std::string& s, int max_lines) {
  std::istringstream ss(s);
  std::string line;
  std::ostringstream out;
  int n = 0;
  while (std::getline(ss, line) && n < max_lines) {
    out << "    " << line << "\n";
    ++n;
  }
  return out.str();
}

static RunResult run_step(const std::vector<std::string>& argv) {
  print_cmd(argv);
  return run_cmd_capture_timed(argv, CLI_TIMEOUT_MS);
}

static bool expect_stdout(const std::vector<std::string>& argv, const std::string& want) {
  RunResult r = run_step(argv);
  if (r.code == 124) { print_fail("TIMEOUT/HANG\n" + first_lines(r.err, 10)); return false; }
  if (r.code != 0) { print_fail("exit=" + std::to_string(r.code) + "\n" + first_lines(r.err, 10)); return false; }
  if (r.out != want) {
    print_fail("unexpected output\n  expected:\n" + first_lines(want, 10) + "  got:\n" + first_lines(r.out, 10));
    return false;
  }
  print_ok();
  return true;
}

static bool expect_exit(const std::vector<std::string>& argv, kravgen::ExitCode want) {
  RunResult r = run_step(argv);
  if (r.code == 124) { print_fail("TIMEOUT/HANG"); return false; }
  if (r.code != static_cast<int>(want)) {
    print_fail("expected exit " + std::to_string(static_cast<int>(want)) + ", got " + std::to_string(r.code) +
               "\n" + first_lines(r.err, 10));
    return false;
  }
  std::cout << "  stderr: " << (r.err.empty() ? std::string("(empty)\n") : first_lines(r.err, 1).substr(4));
  print_ok();
  return true;
}

int main(int argc, char** argv) {
  using kravgen::ExitCode;
  namespace tc = kravgen::testcases;

  try {
    std::string bin = "./kravgen";
    if (argc >= 3 && std::string(argv[1]) == "--bin") bin = argv[2];

    print_banner();

    fs::path tmp = fs::temp_directory_path() / ("kravgen_selftest_" + now_ms());
    fs::create_directories(tmp);
    fs::path part_file = tmp / "part.bin";
    write_file(part_file, "hello world");

    const auto& cases = tc::builtin();

    print_step("vectors");
    {
      std::string want;
      for (const auto& c : cases) want += tc::render(c.number, c.expected);
      expect_stdout({bin, "vectors"}, want);
    }

    print_step("vectors --check");
    expect_exit({bin, "vectors", "--check"}, ExitCode::Ok);

    print_step("digest with defaults (testcase 1)");
    expect_stdout({bin, "digest", "--part", "hello world"},
                  farfalle::hex_list(cases[0].expected) + "\n");

    print_step("digest with two parts (testcase 2)");
    expect_stdout({bin, "digest", "--part", "hello", "--part", "world"},
                  farfalle::hex_list(cases[1].expected) + "\n");

    print_step("digest of a part file, 128 bytes (testcase 3)");
    expect_stdout({bin, "digest", "--part-file", part_file.string(), "--out-bytes", "128"},
                  farfalle::hex_list(cases[2].expected) + "\n");

    print_step("digest --format hex");
    expect_stdout({bin, "digest", "--part", "hello world", "--format", "hex"},
                  farfalle::hex_lower(cases[0].expected) + "\n");

    print_step("digest --instance xoofff matches the library");
    {
      farfalle::PrfParams p;
      p.instance = farfalle::Instance::Xoofff;
      const auto want = farfalle::deck_digest(farfalle::as_bytes("xoofff key"),
                                              {farfalle::as_bytes("hello world")}, 48, p);
      expect_stdout({bin, "digest", "--instance", "xoofff", "--key", "xoofff key",
                     "--part", "hello world", "--out-bytes", "48", "--format", "hex"},
                    farfalle::hex_lower(want) + "\n");
    }

    print_step("negative length must fail");
    expect_exit({bin, "digest", "--part", "x", "--out-bytes", "-1"}, ExitCode::CryptoError);

    print_step("empty key must fail");
    expect_exit({bin, "digest", "--key", "", "--part", "x"}, ExitCode::CryptoError);

    print_step("oversized key must fail");
    expect_exit({bin, "digest", "--key", std::string(200, 'k'), "--part", "x"}, ExitCode::CryptoError);

    print_step("missing part file must fail");
    expect_exit({bin, "digest", "--part-file", (tmp / "missing.bin").string()}, ExitCode::IoError);

    print_step("bad arguments must fail");
    expect_exit({bin, "digest", "--out-bytes", "ten"}, ExitCode::Usage);
    expect_exit({bin, "vectors", "--check", "--key", "other"}, ExitCode::Usage);

    print_step("unknown command must fail");
    expect_exit({bin, "frobnicate"}, ExitCode::Usage);

    std::error_code ec;
    fs::remove_all(tmp, ec);

    std::cout << "\n=======================\n";
    if (!g_any_fail) {
      std::cout << "SELFTEST: OK\n";
      std::cout << "ALL CHECKS PASSED\n";
    } else {
      std::cout << "SELFTEST: FAIL\n";
      std::cout << "FAILED CHECKS: " << g_fail_count << "\n";
    }
    std::cout << "=======================\n";

    return g_any_fail ? 1 : 0;

  } catch (const std::exception& e) {
    std::cout << "\n[FATAL]\n";
    std::cout << "  SELFTEST crashed with std::exception: " << e.what() << "\n";
    return 2;
  }
}
