#include "view.hpp"
#include "selector_text.hpp"
#include "utf8.hpp"
#include <algorithm>

static const int kConfirmWidth = 56;

std::string ScreenLine::text() const {
  std::vector<Segment> sorted = segments;
  std::stable_sort(sorted.begin(), sorted.end(), [](const Segment& a, const Segment& b) { return a.col < b.col; });
  std::string out;
  size_t col = 0;
  for (const auto& seg : sorted) {
    if (static_cast<size_t>(seg.col) < col) continue; // overlapped by an earlier segment
    if (static_cast<size_t>(seg.col) > col) { out.append(seg.col - col, ' '); col = seg.col; }
    out += seg.text;
    col += utf8_width(seg.text);
  }
  return out;
}

int list_body_height(TermSize size) { return compute_layout(size, View::List).body.height; }
int detail_body_height(TermSize size) { return compute_layout(size, View::Detail).body.height; }

static void put(Screen& s, int row, int col, const std::string& text, Style style) {
  if (row < 0 || row >= static_cast<int>(s.lines.size()) || col >= s.size.cols) return;
  std::string cut = utf8_prefix(text, static_cast<size_t>(std::max(0, s.size.cols - col)));
  if (cut.empty()) return;
  s.lines[row].segments.push_back(Segment{col, cut, style});
}

static std::string list_row_text(const ListRow& r, int width) {
  std::string title = r.title;
  std::string desc = r.description;
  int max_w = width - 4;
  if (max_w > 0) {
    title = utf8_truncate(title, static_cast<size_t>(max_w));
    desc = utf8_truncate(desc, static_cast<size_t>(max_w));
  }
  return desc.empty() ? title : title + " - " + desc;
}

static Style status_style(StatusLevel level) {
  switch (level) {
    case StatusLevel::Info: return Style::Normal;
    case StatusLevel::Success: return Style::Success;
    case StatusLevel::Error: return Style::Error;
  }
  return Style::Normal;
}

static void compose_list(const ViewModel& vm, const ScreenLayout& l, Screen& s) {
  put(s, l.header.row, 1, vm.title, Style::Title);
  if (l.header.height > 1) {
    std::string info;
    if (vm.filter_typing) info = "Filter: " + vm.filter_query + "_";
    else if (!vm.filter_query.empty())
      info = "Filter: " + vm.filter_query + "  (" + std::to_string(vm.rows.size()) + "/" + std::to_string(vm.total_items) + ")";
    else info = std::to_string(vm.rows.size()) + (vm.rows.size() == 1 ? " item" : " items");
    put(s, l.header.row + 1, 1, info, Style::Dim);
  }

  if (vm.rows.empty() && l.body.height > 0) {
    put(s, l.body.row, 2, "No items.", Style::Dim);
  }
  for (int i = 0; i < l.body.height; ++i) {
    int idx = vm.list_top + i;
    if (idx < 0 || idx >= static_cast<int>(vm.rows.size())) break;
    const ListRow& r = vm.rows[idx];
    std::string line = list_row_text(r, s.size.cols);
    bool selected = idx == vm.cursor;
    Style st = r.skippable ? Style::Strike : (selected ? Style::Selected : Style::Normal);
    put(s, l.body.row + i, 0, (selected ? "> " : "  ") + line, st);
  }

  std::string footer = vm.footer_override.empty() ? join_actions(vm.footer_actions) : vm.footer_override;
  put(s, l.footer.row, 0, footer, Style::Dim);
}

static void compose_detail(const ViewModel& vm, const ScreenLayout& l, Screen& s) {
  std::string hints = vm.detail_header.empty() ? join_actions(vm.footer_actions) : vm.detail_header;
  put(s, l.header.row, 0, "Detail View", Style::Title);
  put(s, l.header.row, 13, hints, Style::Dim);

  int total = static_cast<int>(vm.detail_lines.size());
  int top = std::clamp(vm.detail_top, 0, std::max(0, total - l.body.height));
  for (int i = 0; i < l.body.height; ++i) {
    int idx = top + i;
    if (idx >= total) break;
    const std::string& line = vm.detail_lines[idx];
    Style st = line.find("SELECTED") != std::string::npos ? Style::Highlight : Style::Normal;
    put(s, l.body.row + i, 0, line, st);
  }

  put(s, l.footer.row, 0, join_actions(vm.footer_actions), Style::Dim);
}

static void compose_overlay(const ViewModel& vm, Screen& s) {
  std::vector<std::string> content;
  int pad_rows = 1, pad_cols = 2;
  if (vm.overlay == OverlayKind::Confirmation) {
    size_t width = static_cast<size_t>(std::min(kConfirmWidth, std::max(8, s.size.cols - 6)));
    for (const auto& l : vm.overlay_lines) utf8_wrap_into(l, width, content);
  } else {
    content = vm.overlay_lines;
  }
  int content_cols = 0;
  for (const auto& l : content) content_cols = std::max(content_cols, static_cast<int>(utf8_width(l)));
  if (vm.overlay == OverlayKind::Confirmation) content_cols = std::max(content_cols, std::min(kConfirmWidth, s.size.cols - 6));
  Rect box = centered_box(s.size, static_cast<int>(content.size()), content_cols, pad_rows, pad_cols);
  if (box.height < 2 || box.width < 2) {
    for (int i = 0; i < static_cast<int>(content.size()) && i < s.size.rows; ++i) put(s, i, 0, content[i], Style::Normal);
    return;
  }

  std::string horiz;
  for (int i = 0; i < box.width - 2; ++i) horiz += "\xE2\x94\x80";
  put(s, box.row, box.col, "\xE2\x95\xAD" + horiz + "\xE2\x95\xAE", Style::Border);
  for (int r = 1; r < box.height - 1; ++r) {
    put(s, box.row + r, box.col, "\xE2\x94\x82", Style::Border);
    put(s, box.row + r, box.col + box.width - 1, "\xE2\x94\x82", Style::Border);
    int ci = r - 1 - pad_rows;
    if (ci >= 0 && ci < static_cast<int>(content.size())) {
      std::string text = utf8_prefix(content[ci], static_cast<size_t>(std::max(0, box.width - 2 - 2 * pad_cols)));
      Style st = (ci == 0 && vm.overlay == OverlayKind::Help) ? Style::Title : Style::Normal;
      put(s, box.row + r, box.col + 1 + pad_cols, text, st);
    }
  }
  put(s, box.row + box.height - 1, box.col, "\xE2\x95\xB0" + horiz + "\xE2\x95\xAF", Style::Border);
}

Screen ViewRenderer::compose(const ViewModel& vm, TermSize size) const {
  Screen s;
  s.size = TermSize{std::max(0, size.rows), std::max(0, size.cols)};
  s.lines.resize(s.size.rows);

  if (vm.overlay != OverlayKind::None) {
    compose_overlay(vm, s);
    return s;
  }

  ScreenLayout l = compute_layout(s.size, vm.view);
  if (vm.view == View::Detail) compose_detail(vm, l, s);
  else compose_list(vm, l, s);
  if (!vm.status.empty() && l.status.height > 0) put(s, l.status.row, 0, vm.status, status_style(vm.status_level));
  return s;
}

void ViewRenderer::paint(ITerminal& term, const Screen& screen) const {
  term.clear();
  for (int r = 0; r < static_cast<int>(screen.lines.size()); ++r) {
    for (const auto& seg : screen.lines[r].segments) {
      if (seg.style == Style::Normal) term.draw_text(r, seg.col, seg.text);
      else term.draw_styled(r, seg.col, seg.text, seg.style);
    }
  }
  term.refresh();
}
