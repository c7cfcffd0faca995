#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <unistd.h>

namespace devmon::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, int min_height, const std::string& border_sgr) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  const std::string on = border_sgr;
  const std::string off = border_sgr.empty() ? std::string() : sgr_reset();
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return on + TL + repeat_str(H, left) + off + t + on + repeat_str(H, right) + TR + off;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(on + V + off + trunc_pad(ln, iw) + sgr_reset() + on + V + off);
  }
  out.push_back(on + BL + repeat_str(H, iw) + BR + off);
  return out;
}

std::string tone_sgr(devmon::app::LogTone tone) {
  using devmon::app::LogTone;
  switch (tone) {
    case LogTone::Error: return sgr("1;31");
    case LogTone::Warn:  return sgr_fg_yel();
    case LogTone::Info:  return sgr_dim();
    case LogTone::Build: return sgr_fg_grn();
    case LogTone::Watch: return sgr_fg_cyan();
    case LogTone::Hot:   return sgr_fg_magenta();
    case LogTone::Plain: break;
  }
  return {};
}

static std::string rstrip(const std::string& s) {
  size_t end = s.size();
  while (end > 0 && (s[end-1] == ' ' || s[end-1] == '\t' || s[end-1] == '\r' || s[end-1] == '\n')) --end;
  return s.substr(0, end);
}

// Tabs become spaces and other control bytes are dropped so column math holds
static std::string printable(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\t') out += "    ";
    else if ((unsigned char)c >= 0x20 && c != 0x7F) out.push_back(c);
  }
  return out;
}

const char* service_color_code(std::string_view name) {
  static constexpr std::pair<std::string_view, const char*> kColors[] = {
    {"green", "32"}, {"cyan", "96"}, {"yellow", "33"},
    {"magenta", "35"}, {"red", "31"}, {"blue", "34"},
  };
  for (const auto& [n, code] : kColors)
    if (n == name) return code;
  return nullptr;
}

namespace {

constexpr int kNameW = 18;
constexpr int kNumW  = 9;

std::string service_row(const std::string& name, const std::string& cpu, const std::string& mem,
                        const std::string& ram, bool up, const std::string& name_sgr) {
  const bool uni = use_unicode();
  std::string dot = up ? sgr_fg_grn() + (uni ? "●" : "*") : sgr_dim() + (uni ? "○" : "o");
  std::string dim = up ? std::string() : sgr_dim();
  return name_sgr + dim + trunc_pad(name, kNameW) + sgr_reset()
       + rpad_trunc(cpu, kNumW) + rpad_trunc(mem, kNumW) + rpad_trunc(ram, kNumW + 2)
       + "  " + dot + sgr_reset();
}

} // namespace

std::vector<std::string> compose_frame(const devmon::model::DashboardState& s,
                                       const FrameOptions& opt, int cols, int rows) {
  cols = std::max(cols, 20);
  rows = std::max(rows, 8);
  std::vector<std::string> frame;
  const std::string sep = sgr_dim() + "  |  " + sgr_reset();

  // Header
  frame.push_back(trunc_pad("  " + sgr_bold() + sgr_fg_cyan() + opt.title + sgr_reset()
                            + sep + sgr_fg_grn() + opt.url + sgr_reset()
                            + sep + sgr_fg_yel() + "Ctrl+C to stop" + sgr_reset(), cols));

  // Services
  std::vector<std::string> svc;
  svc.push_back(sgr_bold() + sgr_fg_cyan()
                + trunc_pad("Service", kNameW) + rpad_trunc("CPU", kNumW) + rpad_trunc("MEM", kNumW)
                + rpad_trunc("RAM", kNumW + 2) + "  " + "St" + sgr_reset());
  for (const auto& row : s.services) {
    if (row.sample) {
      const char* code = service_color_code(row.color);
      svc.push_back(service_row(row.name, fmt_pct(row.sample->cpu_pct), fmt_pct(row.sample->mem_pct),
                                fmt_mb(row.sample->resident_mb), true, sgr(code ? code : "32")));
    } else {
      svc.push_back(service_row(row.name, "-", "-", "-", false, std::string()));
    }
  }
  if (s.storage.exists) {
    svc.push_back(service_row("SQLite DB", "-", "-", fmt_mb(s.storage.size_mb), true, sgr_fg_magenta()));
  } else {
    svc.push_back(service_row("SQLite DB", "-", "-", "-", false, std::string()));
  }
  auto svc_box = make_box("Services", svc, cols, 0, sgr_fg_cyan());
  frame.insert(frame.end(), svc_box.begin(), svc_box.end());

  // Logs: whatever height is left between the services box and the footer
  int room = rows - (int)frame.size() - 1 - 2;
  int log_h = std::max(1, std::min(opt.tail_lines, room));
  std::vector<std::string> logs;
  std::string title = "Logs";
  std::string border;
  if (s.log_tail.empty()) {
    logs.push_back(sgr_dim() + "Waiting for logs..." + sgr_reset());
    border = sgr_dim();
  } else {
    size_t first = s.log_tail.size() > (size_t)log_h ? s.log_tail.size() - (size_t)log_h : 0;
    for (size_t i = first; i < s.log_tail.size(); ++i) {
      std::string ln = printable(rstrip(s.log_tail[i]));
      std::string on = tone_sgr(devmon::app::classify_line(s.log_tail[i]));
      logs.push_back(on + ln + (on.empty() ? std::string() : sgr_reset()));
    }
    if (s.has_error) {
      title += " " + sgr_fg_red() + "[E] copy error" + sgr_reset();
      border = sgr_fg_red();
    } else {
      border = sgr_fg_grn();
    }
  }
  auto log_box = make_box(title, logs, cols, log_h, border);
  frame.insert(frame.end(), log_box.begin(), log_box.end());

  // Footer
  std::string footer = "  ";
  if (s.status && s.status->visible(s.updated_at, opt.status_ttl)) {
    footer += sgr_bold() + sgr_fg_grn() + s.status->text + sgr_reset() + sep;
  }
  footer += sgr_fg_cyan() + "CPU " + fmt_pct(s.system.cpu_total_pct) + sgr_reset() + sep;
  if (s.system.known()) {
    footer += sgr_fg_cyan() + "RAM " + std::to_string(s.system.mem_used_mb) + "/"
            + std::to_string(s.system.mem_total_mb) + "MB (" + fmt_fixed(s.system.mem_pct(), 1) + "%)"
            + sgr_reset();
  } else {
    footer += sgr_dim() + "RAM ?" + sgr_reset();
  }
  auto secs = std::chrono::duration<double>(opt.refresh).count();
  footer += sep + sgr_dim() + "Refresh: " + fmt_fixed(secs, secs == (double)(long long)secs ? 0 : 1) + "s" + sgr_reset();
  frame.push_back(trunc_pad(footer, cols));

  for (auto& ln : frame) ln = trunc_pad(ln, cols);
  return frame;
}

void TerminalRenderer::render(const devmon::model::DashboardState& state) {
  int cols = term_cols();
  int rows = term_rows();
  auto lines = compose_frame(state, opt_, cols, rows);
  std::string frame; frame.reserve((size_t)rows * (size_t)cols + 64);
  frame += "\x1B[H";
  for (int row = 0; row < rows; ++row) {
    frame += (row < (int)lines.size()) ? lines[row] : std::string(cols, ' ');
    if (row < rows - 1) frame += "\n";
  }
  frame += "\x1B[" + std::to_string(rows) + ";" + std::to_string(cols) + "H";
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

} // namespace devmon::ui
