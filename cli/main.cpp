/**
 * @file main.cpp
 * @brief ghostcomm CLI - Linux front end around the GhostComm codec.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global flags plus encode / decode / reset /
 *    profiles / config subcommands.
 *  - encode: bytes (file or stdin) → bit-pack → volumes sized for a transport
 *    profile, written as blank-line separated wire text.
 *  - decode: every --in file (or stdin) is one paste event fed to a Receiver;
 *    partial progress persists under XDG config (~/.config/ghostcomm) so the
 *    next invocation continues the same receiving flow.
 *
 * Notes:
 *  - Diagnostics go to stderr as `status=... reason=...` lines (or JSON with
 *    --format json); payload bytes go to --out or stdout.
 *  - Exit codes: 0 ok, 2 usage or I/O error, 3 incomplete, 4 integrity failure.
 *  - State files: <state dir>/config.json, <state dir>/session.json.
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <iterator>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "ghostcomm/alphabet.hpp"
#include "ghostcomm/bitpack.hpp"
#include "ghostcomm/chunker.hpp"
#include "ghostcomm/config.hpp"
#include "ghostcomm/parser.hpp"
#include "ghostcomm/profiles.hpp"
#include "ghostcomm/receiver.hpp"
#include "ghostcomm/session_store.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace ghostcomm;

static constexpr int EXIT_OK         = 0;
static constexpr int EXIT_USAGE      = 2;
static constexpr int EXIT_INCOMPLETE = 3;
static constexpr int EXIT_INTEGRITY  = 4;

// ---------- small utilities ----------

static bool is_tty_stderr() { return ::isatty(fileno(stderr)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static uint64_t now_ms_system() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Whole file, or all of stdin when path is empty or "-".
static bool read_all(const std::string& path, std::string& out) {
  if (path.empty() || path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

// Whole buffer to file, or to stdout when path is empty or "-".
static bool write_all(const std::string& path, const char* data, size_t len) {
  if (path.empty() || path == "-") {
    std::cout.write(data, static_cast<std::streamsize>(len));
    std::cout.flush();
    return static_cast<bool>(std::cout);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(data, static_cast<std::streamsize>(len));
  return static_cast<bool>(out);
}

// One diagnostic line: "status=<status> k=v ..." or a JSON event.
struct Reporter {
  Ansi        ansi;
  std::string format;

  void error(const std::string& reason) const {
    if (format == "json") std::cerr << parser::event_json("error", reason) << "\n";
    else                  std::cerr << ansi.red("status=error") << " reason=" << reason << "\n";
  }
  void line(const std::string& status, const std::string& rest) const {
    if (format == "json") { std::cerr << parser::event_json(status, rest) << "\n"; return; }
    const std::string head = "status=" + status;
    std::cerr << (status == "ok" ? ansi.green(head) : ansi.bold(head));
    if (!rest.empty()) std::cerr << " " << rest;
    std::cerr << "\n";
  }
};

// Drain receiver diagnostics (pretty: dim lines; json: one object per line).
static void drain_events(Receiver& rx, const Reporter& rep) {
  ReceiverEvent ev;
  while (rx.get_event(ev)) {
    if (rep.format == "json") {
      std::cerr << parser::receiver_event_to_json(ev) << "\n";
    } else if (rep.format == "pretty") {
      std::string s = std::string("  ") + to_string(ev.kind);
      if (ev.total) s += " " + std::to_string(ev.index) + "/" + std::to_string(ev.total);
      if (!ev.detail.empty()) s += std::string(" ") + ev.detail.c_str();
      std::cerr << rep.ansi.dim(s) << "\n";
    }
  }
}

static std::string join_missing(const std::vector<uint16_t>& missing) {
  std::string s;
  for (size_t i = 0; i < missing.size(); ++i) {
    if (i == 8) { s += ",..."; break; }
    if (i) s += ",";
    s += std::to_string(missing[i]);
  }
  return s;
}

// ---------- subcommands ----------

static int run_encode(const Reporter& rep, const Config& cfg,
                      const std::string& type_name, const std::string& in_path,
                      const std::string& out_path, const std::string& profile_id,
                      size_t max_chars_opt) {
  MediaType type;
  if (!media_type_from_name(type_name, type)) { rep.error("bad_type"); return EXIT_USAGE; }

  // Step 1: resolve the per-volume limit (--max-chars > --profile > config)
  size_t max_chars = max_chars_opt;
  if (max_chars == 0) {
    const TransportProfile* p = find_profile(profile_id.empty() ? cfg.profile : profile_id);
    if (!p) { rep.error("unknown_profile"); return EXIT_USAGE; }
    max_chars = p->max_chars;
  }

  // Step 2: read and encode
  std::string raw;
  if (!read_all(in_path, raw)) { rep.error("read_failed"); return EXIT_USAGE; }

  Alphabet alphabet;
  BitPackCodec codec(alphabet);
  const SymbolString stream = codec.encode(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());

  // Step 3: chunk
  std::vector<std::string> volumes;
  ChunkStatus st = chunk(type, stream, max_chars, volumes);
  if (st != ChunkStatus::Ok) { rep.error(to_string(st)); return EXIT_USAGE; }

  // Step 4: emit
  std::string text;
  if (rep.format == "json") {
    json j;
    j["type"]      = "encoded";
    j["media"]     = std::string(1, to_char(type));
    j["bytes"]     = raw.size();
    j["symbols"]   = stream.size();
    j["max_chars"] = max_chars;
    j["volumes"]   = volumes;
    text = j.dump(2) + "\n";
  } else {
    for (size_t i = 0; i < volumes.size(); ++i) {
      if (i) text += "\n";
      text += volumes[i];
      text += "\n";
    }
  }
  if (!write_all(out_path, text.data(), text.size())) { rep.error("write_failed"); return EXIT_USAGE; }

  if (rep.format == "pretty") {
    rep.line("ok", "volumes=" + std::to_string(volumes.size()) +
                   " bytes=" + std::to_string(raw.size()) +
                   " max_chars=" + std::to_string(max_chars) +
                   " type=" + to_string(type));
  }
  return EXIT_OK;
}

static int run_decode(const Reporter& rep, const fs::path& state_dir,
                      const std::vector<std::string>& in_paths,
                      const std::string& out_path, bool stateless) {
  Alphabet alphabet;
  Receiver rx(alphabet);

  // Step 1: restore earlier paste events
  if (!stateless) {
    Session s;
    if (!load_session(state_dir, s)) {
      rep.error("session_unreadable");
      return EXIT_USAGE;
    }
    if (!s.volumes.empty()) {
      std::string saved;
      for (const std::string& w : s.volumes) { saved += w; saved += "\n"; }
      rx.feed(saved);
      rx.clear_events();   // already reported when they first arrived
    }
  }

  // Step 2: each input is one paste event
  std::vector<std::string> sources = in_paths;
  if (sources.empty()) sources.push_back("-");

  for (const std::string& src : sources) {
    std::string text;
    if (!read_all(src, text)) { rep.error("read_failed"); return EXIT_USAGE; }
    FeedReport r = rx.feed(text);
    drain_events(rx, rep);
    if (rep.format == "json") std::cerr << parser::report_to_json(r) << "\n";
  }

  // Step 3: outcome
  switch (rx.state()) {
    case ReceiverState::Complete: {
      const Bytes& bytes = rx.result();
      if (!write_all(out_path, reinterpret_cast<const char*>(bytes.data()), bytes.size())) {
        rep.error("write_failed");
        return EXIT_USAGE;
      }
      if (!stateless && !clear_session(state_dir)) return EXIT_USAGE;
      rep.line("ok", "bytes=" + std::to_string(bytes.size()) +
                     " volumes=" + std::to_string(rx.total()) +
                     " type=" + to_string(rx.type()) +
                     " mime=" + mime_type(rx.type()));
      return EXIT_OK;
    }

    case ReceiverState::Error: {
      // All volumes verified but the stream is unusable; start over next time
      if (!stateless && !clear_session(state_dir)) return EXIT_USAGE;
      rep.line("error", std::string("reason=") + to_string(rx.failure()) +
                        " decode=" + to_string(rx.decode_status()));
      return EXIT_INTEGRITY;
    }

    case ReceiverState::Accumulating:
      if (!stateless && !save_session(state_dir, make_session(rx.volumes(), now_ms_system()))) {
        rep.error("session_write_failed");
        return EXIT_USAGE;
      }
      rep.line("incomplete", "have=" + std::to_string(rx.have()) +
                             " total=" + std::to_string(rx.total()) +
                             " missing=" + join_missing(rx.missing()));
      return EXIT_INCOMPLETE;

    case ReceiverState::Idle:
      break;
  }

  rep.line("incomplete", "have=0 total=0 reason=no_volumes");
  return EXIT_INCOMPLETE;
}

static int run_profiles(const Reporter& rep, const Config& cfg) {
  if (rep.format == "json") {
    json arr = json::array();
    for (size_t i = 0; i < TRANSPORT_PROFILE_COUNT; ++i) {
      json j;
      j["id"]        = TRANSPORT_PROFILES[i].id;
      j["name"]      = TRANSPORT_PROFILES[i].name;
      j["max_chars"] = TRANSPORT_PROFILES[i].max_chars;
      j["default"]   = (cfg.profile == TRANSPORT_PROFILES[i].id);
      arr.push_back(j);
    }
    std::cout << arr.dump(2) << "\n";
    return EXIT_OK;
  }

  for (size_t i = 0; i < TRANSPORT_PROFILE_COUNT; ++i) {
    const TransportProfile& p = TRANSPORT_PROFILES[i];
    const bool current = (cfg.profile == p.id);
    std::cout << (current ? rep.ansi.bold("* ") : "  ")
              << std::left << std::setw(6) << p.id << " "
              << std::right << std::setw(7) << p.max_chars << "  "
              << rep.ansi.dim(p.name) << "\n";
  }
  return EXIT_OK;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // CLI-centered options
  std::string opt_format;        // pretty|json|raw; empty => config
  bool        opt_no_color = false;
  std::string opt_state_dir;

  // encode
  std::string enc_type;
  std::string enc_in;
  std::string enc_out;
  std::string enc_profile;
  size_t      enc_max_chars = 0;

  // decode
  std::vector<std::string> dec_in;
  std::string dec_out;
  bool        dec_stateless = false;

  // config
  std::string cfg_profile;
  std::string cfg_format;

  CLI::App app{"GhostComm base-32768 text transport"};
  app.require_subcommand(1);

  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--state-dir", opt_state_dir, "Override state directory");

  CLI::App* enc = app.add_subcommand("encode", "Encode bytes into pasteable volumes");
  enc->add_option("--type,-t", enc_type, "Media type: I|A|V (image|audio|video)")->required();
  enc->add_option("--in,-i", enc_in, "Input file (default: stdin)");
  enc->add_option("--out,-o", enc_out, "Output file (default: stdout)");
  auto* prof_opt = enc->add_option("--profile,-p", enc_profile, "Transport profile id");
  enc->add_option("--max-chars", enc_max_chars, "Per-volume limit in characters")
     ->check(CLI::PositiveNumber)->excludes(prof_opt);

  CLI::App* dec = app.add_subcommand("decode", "Feed pasted text; rebuild when complete");
  dec->add_option("--in,-i", dec_in, "Input file, one paste event each (default: stdin)");
  dec->add_option("--out,-o", dec_out, "Output file for rebuilt bytes (default: stdout)");
  dec->add_flag("--stateless", dec_stateless, "Ignore and do not touch the saved session");

  CLI::App* rst = app.add_subcommand("reset", "Discard the saved receiving session");
  CLI::App* prf = app.add_subcommand("profiles", "List transport profiles");

  CLI::App* cfgc = app.add_subcommand("config", "Show or change defaults");
  cfgc->add_option("--profile", cfg_profile, "Default transport profile id");
  cfgc->add_option("--default-format", cfg_format, "Default output format")->check(CLI::IsMember({"pretty","json","raw"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  // Resolve state dir and load config (flags override the file)
  fs::path state_dir = opt_state_dir.empty() ? default_state_dir() : fs::path(opt_state_dir);
  Config cfg = load_config(state_dir);

  Reporter rep;
  rep.format = opt_format.empty() ? cfg.format : opt_format;
  rep.ansi.enabled = !opt_no_color && is_tty_stderr() && (rep.format == "pretty");

  if (*enc) return run_encode(rep, cfg, enc_type, enc_in, enc_out, enc_profile, enc_max_chars);
  if (*dec) return run_decode(rep, state_dir, dec_in, dec_out, dec_stateless);
  if (*prf) return run_profiles(rep, cfg);

  if (*rst) {
    if (!clear_session(state_dir)) return EXIT_USAGE;
    rep.line("ok", "session=cleared");
    return EXIT_OK;
  }

  if (*cfgc) {
    if (!cfg_profile.empty()) {
      const TransportProfile* p = find_profile(cfg_profile);
      if (!p) { rep.error("unknown_profile"); return EXIT_USAGE; }
      cfg.profile = p->id;
    }
    if (!cfg_format.empty()) cfg.format = cfg_format;
    if (!cfg_profile.empty() || !cfg_format.empty()) {
      if (!save_config(state_dir, cfg)) { rep.error("config_write_failed"); return EXIT_USAGE; }
    }
    if (rep.format == "json") {
      json j;
      j["profile"]   = cfg.profile;
      j["format"]    = cfg.format;
      j["state_dir"] = state_dir.string();
      std::cout << j.dump(2) << "\n";
    } else {
      std::cout << "profile=" << cfg.profile << " format=" << cfg.format
                << " state_dir=" << state_dir.string() << "\n";
    }
    return EXIT_OK;
  }

  return EXIT_USAGE;
}
