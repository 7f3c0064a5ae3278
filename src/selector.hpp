#pragma once
/*
 * Selector
 *
 * Purpose: modal list/detail browser over a caller-owned collection of T. Dispatches keys by
 *          mode, runs host callbacks, hands the terminal to editors/agents and returns the
 *          chosen item (or none).
 * Design: single-threaded loop. Background work (refresh, subprocess runs) reports back only
 *         through the EventQueue, and the loop applies one event at a time.
 * Errors: callback failures (error results or std::exception) become red status lines and leave
 *         the mode as it was. SelectorError (temp file creation) escapes run().
 */
#include "config.hpp"
#include "event_queue.hpp"
#include "input.hpp"
#include "item_renderer.hpp"
#include "key_map.hpp"
#include "log.hpp"
#include "mode_state.hpp"
#include "ncurses_terminal.hpp"
#include "reactions.hpp"
#include "selector_options.hpp"
#include "selector_text.hpp"
#include "subprocess.hpp"
#include "task_runner.hpp"
#include "terminal.hpp"
#include "types.hpp"
#include "view.hpp"
#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

struct SelectorRuntime {
  IProcessLauncher* launcher = nullptr; // nullptr: the selector owns a PosixProcessLauncher
  ITaskRunner* runner = nullptr;        // nullptr: the selector owns a ThreadTaskRunner
  std::string editor = MS_DEFAULT_EDITOR;
  std::string agent = MS_DEFAULT_AGENT;
  int status_seconds = MS_STATUS_SECONDS;

  static SelectorRuntime from_config(const SelectorConfig& cfg) {
    SelectorRuntime rt;
    rt.editor = cfg.editor;
    rt.agent = cfg.agent;
    rt.status_seconds = cfg.status_seconds;
    return rt;
  }
};

template <typename T>
struct SelectionResult {
  std::optional<T> item;
  bool ok() const { return item.has_value(); }
};

struct DetailLoadedEvent {
  unsigned long long token;
};

template <typename T>
struct RefreshFinishedEvent {
  RefreshResult<T> result;
  unsigned long long generation;
};

struct SubprocessFinishedEvent {
  ExternalKind kind;
  ProcessResult result;
};

template <typename T>
using SelectorEvent = std::variant<DetailLoadedEvent, RefreshFinishedEvent<T>, SubprocessFinishedEvent>;

template <typename R>
R error_result(const std::string& err);

template <> inline ActionResult error_result<ActionResult>(const std::string& err) { return ActionResult::failure(err); }
template <> inline PrepareResult error_result<PrepareResult>(const std::string& err) {
  PrepareResult r; r.ok = false; r.error = err; return r;
}
template <> inline AgentResult error_result<AgentResult>(const std::string& err) {
  AgentResult r; r.ok = false; r.message = err; return r;
}
template <> inline EditResult error_result<EditResult>(const std::string& err) {
  EditResult r; r.ok = false; r.message = err; return r;
}
template <> inline ReactionTarget error_result<ReactionTarget>(const std::string& err) {
  ReactionTarget r; r.ok = false; r.error = err; return r;
}

// Runs a host callback; a thrown std::exception becomes the callback's error result.
template <typename Fn>
auto invoke_guarded(spdlog::logger& log, const char* what, Fn&& fn) -> decltype(fn()) {
  using R = decltype(fn());
  try {
    return fn();
  } catch (const std::exception& e) {
    log.warn("{} threw: {}", what, e.what());
    return error_result<R>(e.what());
  }
}

template <typename T>
class Selector {
public:
  Selector(ITerminal& term, const IItemRenderer<T>& renderer, SelectorOptions<T> options,
           SelectorRuntime runtime = SelectorRuntime())
    : term_(term),
      renderer_(renderer),
      opts_(std::move(options)),
      rt_(std::move(runtime)),
      log_(category_logger("selector")),
      own_launcher_(default_launcher(rt_.launcher)),
      own_runner_(default_runner(rt_.runner)),
      launcher_(rt_.launcher ? rt_.launcher : own_launcher_.get()),
      runner_(rt_.runner ? rt_.runner : own_runner_.get()),
      orch_(term_, *launcher_, *runner_),
      mode_(NormalMode{}) {
    bind_actions();
  }

  SelectionResult<T> run(std::vector<T> items) {
    items_ = std::move(items);
    filter_active_ = opts_.filter_default;
    recompute_visible();
    log_->info("selector started with {} items", items_.size());
    try {
      loop();
    } catch (const SelectorError& e) {
      log_->error("selector aborted: {}", e.what());
      if (orch_.active()) orch_.finish();
      throw;
    }
    log_->info("selector finished: {}", result_ ? "selection" : "no selection");
    SelectionResult<T> out;
    out.item = result_;
    return out;
  }

  // inspection, for hosts and tests
  const std::vector<T>& items() const { return items_; }
  size_t visible_count() const { return visible_.size(); }
  bool filter_active() const { return filter_active_; }
  const ModeState<T>& mode() const { return mode_; }
  const std::string& status() const { return status_text_; }
  StatusLevel status_level() const { return status_level_; }
  ViewModel view_model() const { return build_view(); }

private:
  static std::unique_ptr<IProcessLauncher> default_launcher(IProcessLauncher* given) {
    if (given) return nullptr;
    return std::make_unique<PosixProcessLauncher>();
  }

  static std::unique_ptr<ThreadTaskRunner> default_runner(ITaskRunner* given) {
    if (given) return nullptr;
    return std::make_unique<ThreadTaskRunner>();
  }

  void loop() {
    while (!quit_) {
      if (orch_.active()) {
        // the child owns the terminal: no drawing until its completion resumes it
        apply_event(queue_.pop());
        continue;
      }
      expire_status();
      render();
      if (auto ev = queue_.try_pop()) { apply_event(std::move(*ev)); continue; }
      int key = term_.read_key(MS_KEY_TIMEOUT_MS);
      if (key == keys::None) continue;
      handle_key(key);
    }
  }

  void render() {
    TermSize size = term_.getSize();
    list_top_ = follow_cursor(list_top_, cursor_, list_body_height(size), static_cast<int>(visible_.size()));
    view_.render(term_, build_view());
  }

  // ---- snapshot and projection

  bool has_selection() const { return !visible_.empty(); }
  size_t selected_slot() const { return visible_[static_cast<size_t>(cursor_)]; }
  const T& selected() const { return items_[selected_slot()]; }

  void recompute_visible() {
    std::optional<size_t> keep;
    if (has_selection()) keep = selected_slot();
    visible_.clear();
    for (size_t i = 0; i < items_.size(); ++i) {
      if (opts_.filter_predicate && !opts_.filter_predicate(items_[i], filter_active_)) continue;
      if (!filter_query_.empty() && !contains_ignore_case(renderer_.filter_value(items_[i]), filter_query_)) continue;
      visible_.push_back(i);
    }
    if (visible_.empty()) { cursor_ = 0; return; }
    if (keep) {
      auto it = std::lower_bound(visible_.begin(), visible_.end(), *keep);
      if (it != visible_.end() && *it == *keep) { cursor_ = static_cast<int>(it - visible_.begin()); return; }
    }
    cursor_ = std::clamp(cursor_, 0, static_cast<int>(visible_.size()) - 1);
  }

  void move_cursor(int delta) {
    if (visible_.empty()) return;
    cursor_ = std::clamp(cursor_ + delta, 0, static_cast<int>(visible_.size()) - 1);
  }

  std::vector<std::string> preview_lines(const T& item, int highlight) const {
    return split_text_lines(renderer_.preview_with_highlight(item, highlight));
  }

  // ---- modes

  void enter(ModeState<T> next) {
    size_t from = mode_.index();
    mode_ = std::move(next);
    if (from != mode_.index()) log_->debug("mode {} -> {}", mode_name(from), mode_name(mode_.index()));
  }

  Origin origin_of(View v) const {
    Origin o;
    o.view = v;
    if (auto* d = std::get_if<DetailMode>(&mode_)) o.detail_top = d->top;
    return o;
  }

  // page to return to; the detail page is rebuilt so in-place edits show up
  ModeState<T> mode_for(const Origin& o) const {
    if (o.view == View::Detail && has_selection()) {
      DetailMode d;
      d.lines = preview_lines(selected(), -1);
      d.top = o.detail_top;
      return d;
    }
    return NormalMode{};
  }

  void return_to(const Origin& o) { enter(mode_for(o)); }

  // ---- status line

  void set_status(const std::string& text, StatusLevel level) {
    status_text_ = text;
    status_level_ = level;
    status_until_ = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(1, rt_.status_seconds));
  }

  void set_error(const std::string& text) {
    log_->warn("{}", text);
    set_status(text, StatusLevel::Error);
  }

  // ok=false -> red line, non-empty message -> plain line
  void report(const ActionResult& res, StatusLevel ok_level = StatusLevel::Info) {
    if (!res.ok) { set_error(res.message); return; }
    if (!res.message.empty()) set_status(res.message, ok_level);
  }

  void expire_status() {
    if (!status_text_.empty() && std::chrono::steady_clock::now() >= status_until_) status_text_.clear();
  }

  // ---- key dispatch

  void handle_key(int key) {
    if (key == keys::Resize) {
      TermSize s = term_.getSize();
      log_->debug("resize {}x{}", s.rows, s.cols);
      return;
    }
    if (key == keys::CtrlC) {
      log_->info("interrupted");
      quit_ = true;
      return;
    }
    switch (mode_.index()) {
      case 0: handle_normal_key(key); break;
      case 1: handle_detail_key(key); break;
      case 2: handle_thread_pick_key(key); break;
      case 3: handle_reaction_key(key); break;
      case 4: break; // keys are not read while a subprocess owns the terminal
      case 5: {
        Origin o = std::get<ConfirmationMode>(mode_).origin;
        return_to(o);
        break;
      }
      case 6: {
        Origin o = std::get<HelpOverlayMode>(mode_).origin;
        return_to(o);
        break;
      }
      default: break;
    }
  }

  void handle_normal_key(int key) {
    NormalMode& normal = std::get<NormalMode>(mode_);
    if (normal.filter_typing) {
      switch (filter_input_.consume(key)) {
        case Input::Result::Editing: break;
        case Input::Result::Accepted: normal.filter_typing = false; break;
        case Input::Result::Cancelled: normal.filter_typing = false; break;
      }
      if (filter_input_.text() != filter_query_) {
        filter_query_ = filter_input_.text();
        recompute_visible();
      }
      return;
    }

    int page = std::max(1, list_body_height(term_.getSize()));
    switch (key) {
      case 'q': quit_ = true; return;
      case '?': enter(HelpOverlayMode{origin_of(View::List)}); return;
      case '/':
        normal.filter_typing = true;
        filter_input_.set_text(filter_query_);
        return;
      case keys::Esc:
        if (!filter_query_.empty()) { filter_query_.clear(); filter_input_.reset(); recompute_visible(); }
        return;
      case keys::Enter: case keys::Right: case 'l': open_detail(); return;
      case keys::Up: case 'k': move_cursor(-1); return;
      case keys::Down: case 'j': move_cursor(1); return;
      case keys::PageUp: move_cursor(-page); return;
      case keys::PageDown: move_cursor(page); return;
      case keys::Home: case 'g': move_cursor(-static_cast<int>(visible_.size())); return;
      case keys::End: case 'G': move_cursor(static_cast<int>(visible_.size())); return;
      case 'i': if (opts_.refresh_items) start_refresh(); return;
      case 'h': case keys::Tab: if (opts_.filter_predicate) toggle_filter(); return;
      default: break;
    }
    actions_.dispatch(key, View::List);
  }

  void handle_detail_key(int key) {
    DetailMode& d = std::get<DetailMode>(mode_);
    int height = detail_body_height(term_.getSize());
    int max_top = std::max(0, static_cast<int>(d.lines.size()) - height);
    switch (key) {
      case keys::Esc: case keys::Backspace: case keys::Left: case 'h': case 'q':
        enter(NormalMode{});
        return;
      case keys::Enter:
        if (has_selection()) { result_ = selected(); quit_ = true; }
        return;
      case keys::Up: case 'k': d.top = std::max(0, d.top - 1); return;
      case keys::Down: case 'j': d.top = std::min(max_top, d.top + 1); return;
      case keys::CtrlF: case keys::PageDown: case ' ': d.top = std::min(max_top, d.top + height); return;
      case keys::CtrlB: case keys::PageUp: d.top = std::max(0, d.top - height); return;
      case keys::Home: case 'g': d.top = 0; return;
      case keys::End: case 'G': d.top = max_top; return;
      case '?': enter(HelpOverlayMode{origin_of(View::Detail)}); return;
      default: break;
    }
    actions_.dispatch(key, View::Detail);
  }

  void handle_thread_pick_key(int key) {
    ThreadPickMode<T>& pick = std::get<ThreadPickMode<T>>(mode_);
    if (key == keys::Enter) {
      ThreadPickMode<T> done = pick;
      execute_thread_action(done);
      return;
    }
    if (key == pick.key) {
      pick.index = (pick.index + 1) % std::max(1, pick.count);
      return;
    }
    // Esc or any other key cancels; the key itself is not acted on
    Origin o = pick.origin;
    return_to(o);
    set_status("Selection cancelled", StatusLevel::Info);
  }

  void handle_reaction_key(int key) {
    ReactionPickMode& pick = std::get<ReactionPickMode>(mode_);
    if (key == keys::Enter) {
      ReactionPickMode done = pick;
      complete_reaction(done);
      return;
    }
    if (key == pick.key) {
      pick.index = next_reaction(pick.index);
      return;
    }
    Origin o = pick.origin;
    return_to(o);
    set_status("Reaction cancelled", StatusLevel::Info);
  }

  // ---- actions

  // paired actions exist only when both halves are set
  bool editor_action_enabled(EditAction a) const {
    return static_cast<bool>(preparer_for(a)) && static_cast<bool>(completer_for(a));
  }
  bool reaction_enabled() const { return opts_.reaction_action && opts_.reaction_complete; }

  void bind_actions() {
    auto bind_label = [this](const std::string& label, const char* name, KeyMap::Handler h) {
      int k = key_from_name(split_action_key(label).first);
      if (k != keys::None) actions_.bind(k, name, std::move(h));
    };
    if (opts_.on_open) actions_.bind('o', "open", [this](View v) { do_open(v); });
    if (opts_.resolve_action) {
      bind_label(opts_.resolve_key, "resolve", [this](View v) { do_resolve(v); });
      bind_label(opts_.resolve_key_alt, "resolve", [this](View v) { do_resolve(v); });
    }
    if (editor_action_enabled(EditAction::ResolveWithComment)) {
      bind_label(opts_.resolve_comment_key, "resolve+comment", [this](View v) { do_resolve_comment(v); });
      bind_label(opts_.resolve_comment_key_alt, "resolve+comment", [this](View v) { do_resolve_comment(v); });
    }
    if (editor_action_enabled(EditAction::Quote)) {
      bind_label(opts_.quote_key, "quote", [this](View v) { begin_thread_action(PickAction::Quote, opts_.quote_key, v); });
    }
    if (editor_action_enabled(EditAction::QuoteWithContext)) {
      bind_label(opts_.quote_context_key, "quote+context",
                 [this](View v) { begin_thread_action(PickAction::QuoteWithContext, opts_.quote_context_key, v); });
    }
    if (opts_.agent_action) {
      bind_label(opts_.agent_key, "agent", [this](View v) { begin_thread_action(PickAction::Agent, opts_.agent_key, v); });
    }
    if (opts_.edit_action) bind_label(opts_.edit_key, "edit", [this](View v) { do_edit(v); });
    if (reaction_enabled()) {
      bind_label(opts_.reaction_key, "react", [this](View v) { begin_thread_action(PickAction::React, opts_.reaction_key, v); });
    }
    log_->debug("{} action keys bound", actions_.size());
  }

  bool selected_is_resolved() const {
    if (!opts_.is_resolved || !has_selection()) return false;
    try {
      return opts_.is_resolved(selected());
    } catch (const std::exception& e) {
      log_->warn("is_resolved threw: {}", e.what());
      return false;
    }
  }

  ActionSet action_set() const {
    bool resolved = selected_is_resolved();
    ActionSet s;
    s.open = static_cast<bool>(opts_.on_open);
    if (opts_.resolve_action)
      s.resolve = (resolved && !opts_.resolve_key_alt.empty()) ? opts_.resolve_key_alt : opts_.resolve_key;
    if (editor_action_enabled(EditAction::ResolveWithComment))
      s.resolve_comment = (resolved && !opts_.resolve_comment_key_alt.empty()) ? opts_.resolve_comment_key_alt : opts_.resolve_comment_key;
    if (editor_action_enabled(EditAction::Quote)) s.quote = opts_.quote_key;
    if (editor_action_enabled(EditAction::QuoteWithContext)) s.quote_context = opts_.quote_context_key;
    if (opts_.agent_action) s.agent = opts_.agent_key;
    if (opts_.edit_action) s.edit = opts_.edit_key;
    if (reaction_enabled()) s.react = opts_.reaction_key;
    s.refresh = static_cast<bool>(opts_.refresh_items);
    s.filter = static_cast<bool>(opts_.filter_predicate);
    return s;
  }

  void open_detail() {
    if (!has_selection()) return;
    if (opts_.on_select) {
      T item = selected();
      ActionResult res = invoke_guarded(*log_, "on_select", [&] { return opts_.on_select(item); });
      // the callback may have collapsed or expanded groups
      recompute_visible();
      if (!res.ok) { set_error(res.message); return; }
      if (!res.message.empty()) { set_status(res.message, StatusLevel::Info); return; }
      if (!has_selection()) return;
    }
    DetailMode d;
    d.lines = {"Loading..."};
    d.loading = true;
    d.token = ++detail_token_;
    enter(std::move(d));
    queue_.push(DetailLoadedEvent{detail_token_});
  }

  void refresh_detail_page() {
    if (auto* d = std::get_if<DetailMode>(&mode_)) {
      if (!has_selection()) { enter(NormalMode{}); return; }
      d->lines = preview_lines(selected(), -1);
      d->loading = false;
    }
  }

  void toggle_filter() {
    filter_active_ = !filter_active_;
    recompute_visible();
    set_status(filter_active_ ? "Hiding resolved" : "Showing all", StatusLevel::Info);
  }

  void start_refresh() {
    if (refreshing_) return;
    refreshing_ = true;
    unsigned long long gen = generation_;
    log_->info("refresh started");
    runner_->submit([this, gen]() {
      RefreshResult<T> r;
      try {
        r = opts_.refresh_items();
      } catch (const std::exception& e) {
        r.ok = false;
        r.error = e.what();
      }
      queue_.push(RefreshFinishedEvent<T>{std::move(r), gen});
    });
  }

  void do_open(View) {
    if (!has_selection()) return;
    T item = selected();
    report(invoke_guarded(*log_, "on_open", [&] { return opts_.on_open(item); }));
  }

  void do_resolve(View) {
    if (!has_selection()) return;
    size_t slot = selected_slot();
    T item = items_[slot];
    ActionResult res = invoke_guarded(*log_, "resolve", [&] { return opts_.resolve_action(item); });
    if (!res.ok) { set_error(res.message); return; }
    items_[slot] = item;
    refresh_detail_page();
    report(res, StatusLevel::Success);
  }

  void do_resolve_comment(View v) {
    if (!has_selection()) return;
    start_editor_session(EditAction::ResolveWithComment, selected(), selected_slot(), origin_of(v));
  }

  void do_edit(View v) {
    if (!has_selection()) return;
    T item = selected();
    EditResult res = invoke_guarded(*log_, "edit", [&] { return opts_.edit_action(item); });
    if (!res.ok) { set_error(res.message); return; }
    if (!res.target) {
      if (!res.message.empty()) set_status(res.message, StatusLevel::Info);
      return;
    }
    launch(ExternalKind::FileEdit, std::nullopt, item, selected_slot(), std::nullopt, origin_of(v),
           editor_argv(rt_.editor, res.target->path, res.target->line));
  }

  // quote, quote+context, agent and react offer a thread pick first when the item has replies
  void begin_thread_action(PickAction action, const std::string& label, View v) {
    if (!has_selection()) return;
    const T& item = selected();
    int count = renderer_.thread_comment_count(item);
    if (count > 1) {
      ThreadPickMode<T> pick{action, key_from_name(split_action_key(label).first),
                             split_action_key(label).first, item, selected_slot(), 0, count, origin_of(v)};
      enter(std::move(pick));
      return;
    }
    run_thread_action(action, item, selected_slot(), origin_of(v));
  }

  void execute_thread_action(const ThreadPickMode<T>& pick) {
    T chosen = renderer_.with_selected_comment(pick.item, pick.index);
    log_->debug("thread pick {} of {} chosen", pick.index + 1, pick.count);
    return_to(pick.origin);
    run_thread_action(pick.action, chosen, pick.slot, pick.origin);
  }

  void run_thread_action(PickAction action, const T& item, size_t slot, const Origin& origin) {
    switch (action) {
      case PickAction::Quote: start_editor_session(EditAction::Quote, item, slot, origin); break;
      case PickAction::QuoteWithContext: start_editor_session(EditAction::QuoteWithContext, item, slot, origin); break;
      case PickAction::Agent: run_agent(item, slot, origin); break;
      case PickAction::React: begin_reaction(item, origin); break;
    }
  }

  void run_agent(const T& item, size_t slot, const Origin& origin) {
    AgentResult res = invoke_guarded(*log_, "agent", [&] { return opts_.agent_action(item); });
    if (!res.ok) { set_error(res.message); return; }
    if (!res.prompt) {
      if (!res.message.empty()) set_status(res.message, StatusLevel::Info);
      return;
    }
    launch(ExternalKind::Agent, std::nullopt, item, slot, std::nullopt, origin, agent_argv(rt_.agent, *res.prompt));
  }

  void begin_reaction(const T& item, const Origin& origin) {
    ReactionTarget target = invoke_guarded(*log_, "reaction", [&] { return opts_.reaction_action(item); });
    if (!target.ok) { set_error(target.error); return; }
    std::string label = split_action_key(opts_.reaction_key).first;
    enter(ReactionPickMode{key_from_name(label), label, target.comment_id, 0, origin});
  }

  void complete_reaction(const ReactionPickMode& pick) {
    return_to(pick.origin);
    if (!opts_.reaction_complete) return;
    const Reaction& r = reaction_at(pick.index);
    ActionResult res = invoke_guarded(*log_, "reaction_complete",
                                      [&] { return opts_.reaction_complete(pick.comment_id, r.name); });
    if (!res.ok) { set_error(res.message); return; }
    enter(ConfirmationMode{confirmation_text(res.message), pick.origin});
  }

  const std::function<PrepareResult(const T&)>& preparer_for(EditAction a) const {
    switch (a) {
      case EditAction::ResolveWithComment: return opts_.resolve_comment_prepare;
      case EditAction::Quote: return opts_.quote_prepare;
      case EditAction::QuoteWithContext: break;
    }
    return opts_.quote_context_prepare;
  }

  const std::function<ActionResult(T&, const std::string&)>& completer_for(EditAction a) const {
    switch (a) {
      case EditAction::ResolveWithComment: return opts_.resolve_comment_complete;
      case EditAction::Quote: return opts_.quote_complete;
      case EditAction::QuoteWithContext: break;
    }
    return opts_.quote_context_complete;
  }

  void start_editor_session(EditAction action, const T& item, size_t slot, const Origin& origin) {
    const auto& prepare = preparer_for(action);
    if (!prepare) return;
    PrepareResult prep = invoke_guarded(*log_, "prepare", [&] { return prepare(item); });
    if (!prep.ok) { set_error(prep.error); return; }

    TempFile file = TempFile::create(); // throws SelectorError: fatal
    std::string msg;
    if (!file.write(prep.text, msg)) { set_error(msg); return; }
    std::vector<std::string> argv = editor_argv(rt_.editor, file.path(), 0);
    launch(ExternalKind::Editor, action, item, slot, std::move(file), origin, std::move(argv));
  }

  void launch(ExternalKind kind, std::optional<EditAction> action, const T& item, size_t slot,
              std::optional<TempFile> file, const Origin& origin, std::vector<std::string> argv) {
    EditorPendingMode<T> pending{kind, action, item, slot, generation_, std::move(file), origin};
    enter(std::move(pending));
    orch_.run_external(kind, std::move(argv), [this](ExternalKind k, const ProcessResult& r) {
      queue_.push(SubprocessFinishedEvent{k, r});
    });
  }

  // ---- events

  void apply_event(SelectorEvent<T> ev) {
    std::visit([this](auto&& e) { on_event(std::move(e)); }, std::move(ev));
  }

  void on_event(DetailLoadedEvent ev) {
    auto* d = std::get_if<DetailMode>(&mode_);
    if (!d || !d->loading || d->token != ev.token) return; // page left before it loaded
    if (!has_selection()) { enter(NormalMode{}); return; }
    d->lines = preview_lines(selected(), -1);
    d->top = 0;
    d->loading = false;
  }

  void on_event(RefreshFinishedEvent<T> ev) {
    refreshing_ = false;
    if (!ev.result.ok) {
      set_error("Refresh failed: " + ev.result.error);
      return;
    }
    items_ = std::move(ev.result.items);
    generation_++;
    recompute_visible();
    if (std::holds_alternative<DetailMode>(mode_)) refresh_detail_page();
    log_->info("refreshed: {} items", items_.size());
    set_status("Refreshed: " + std::to_string(items_.size()) + " items", StatusLevel::Success);
  }

  void on_event(SubprocessFinishedEvent ev) {
    orch_.finish();
    auto* pending_ptr = std::get_if<EditorPendingMode<T>>(&mode_);
    if (!pending_ptr) {
      log_->warn("subprocess finished with no pending session");
      return;
    }
    EditorPendingMode<T> pending = std::move(*pending_ptr);
    return_to(pending.origin);

    switch (ev.kind) {
      case ExternalKind::Agent:
        if (!ev.result.ok) set_error("Agent error: " + ev.result.error);
        else set_status("Agent completed", StatusLevel::Success);
        return;
      case ExternalKind::FileEdit:
        if (!ev.result.ok) set_error("Editor error: " + ev.result.error);
        return;
      case ExternalKind::Editor:
        finish_editor_session(pending, ev.result);
        if (pending.file) pending.file->remove();
        return;
    }
  }

  void finish_editor_session(EditorPendingMode<T>& pending, const ProcessResult& res) {
    if (!res.ok) { set_error("Editor error: " + res.error); return; }
    if (!pending.file || !pending.action) return;
    std::string content, msg;
    if (!pending.file->read(content, msg)) { set_error(msg); return; }
    std::string text = sanitize_editor_content(content);
    if (text.empty()) {
      set_status("Cancelled (empty content)", StatusLevel::Info);
      return;
    }
    const auto& complete = completer_for(*pending.action);
    if (!complete) return;
    T edited = pending.item;
    ActionResult out = invoke_guarded(*log_, "complete", [&] { return complete(edited, text); });
    if (!out.ok) { set_error(out.message); return; }
    if (pending.generation == generation_ && pending.slot < items_.size()) {
      items_[pending.slot] = renderer_.with_selected_comment(edited, 0);
      refresh_detail_page();
    }
    if (contains_url(out.message)) {
      enter(ConfirmationMode{confirmation_text(out.message), pending.origin});
      return;
    }
    if (!out.message.empty()) set_status(out.message, StatusLevel::Success);
  }

  // ---- view model

  ViewModel build_view() const {
    ViewModel vm;
    vm.title = opts_.title;
    vm.total_items = items_.size();
    vm.rows.reserve(visible_.size());
    for (size_t idx : visible_) {
      const T& it = items_[idx];
      vm.rows.push_back(ListRow{renderer_.title(it), renderer_.description(it), renderer_.is_skippable(it)});
    }
    vm.cursor = cursor_;
    vm.list_top = list_top_;
    vm.filter_query = filter_query_;
    vm.status = status_text_;
    vm.status_level = status_level_;

    ActionSet set = action_set();
    auto as_page = [&](const Origin& o) {
      if (o.view == View::Detail && has_selection()) {
        vm.view = View::Detail;
        vm.detail_lines = preview_lines(selected(), -1);
        vm.detail_top = o.detail_top;
        vm.footer_actions = detail_footer_actions(set);
      } else {
        vm.view = View::List;
        vm.footer_actions = list_footer_actions(set);
      }
    };

    switch (mode_.index()) {
      case 0: {
        const NormalMode& n = std::get<NormalMode>(mode_);
        vm.view = View::List;
        vm.filter_typing = n.filter_typing;
        vm.footer_actions = list_footer_actions(set);
        if (refreshing_) vm.footer_override = "Refreshing...";
        break;
      }
      case 1: {
        const DetailMode& d = std::get<DetailMode>(mode_);
        vm.view = View::Detail;
        vm.detail_lines = d.lines;
        vm.detail_top = d.top;
        vm.footer_actions = detail_footer_actions(set);
        break;
      }
      case 2: {
        const ThreadPickMode<T>& p = std::get<ThreadPickMode<T>>(mode_);
        std::string line = thread_pick_status(p.index, p.count, renderer_.thread_comment_preview(p.item, p.index), p.key_label);
        as_page(p.origin);
        if (vm.view == View::Detail) {
          vm.detail_lines = preview_lines(p.item, p.index);
          vm.detail_top = highlight_offset(vm.detail_lines);
          vm.detail_header = line;
        } else {
          vm.footer_override = line;
        }
        break;
      }
      case 3: {
        const ReactionPickMode& p = std::get<ReactionPickMode>(mode_);
        std::string line = reaction_status(p.index, p.key_label);
        as_page(p.origin);
        if (vm.view == View::Detail) vm.detail_header = line;
        else vm.footer_override = line;
        break;
      }
      case 4: as_page(std::get<EditorPendingMode<T>>(mode_).origin); break;
      case 5:
        vm.overlay = OverlayKind::Confirmation;
        vm.overlay_lines = split_text_lines(std::get<ConfirmationMode>(mode_).message);
        break;
      case 6:
        vm.overlay = OverlayKind::Help;
        vm.overlay_lines = help_lines(set);
        break;
      default: break;
    }
    return vm;
  }

  ITerminal& term_;
  const IItemRenderer<T>& renderer_;
  SelectorOptions<T> opts_;
  SelectorRuntime rt_;
  std::shared_ptr<spdlog::logger> log_;
  EventQueue<SelectorEvent<T>> queue_;
  std::unique_ptr<IProcessLauncher> own_launcher_;
  std::unique_ptr<ThreadTaskRunner> own_runner_; // after queue_: joined before the queue goes away
  IProcessLauncher* launcher_;
  ITaskRunner* runner_;
  Orchestrator orch_;
  KeyMap actions_;
  ViewRenderer view_;
  ModeState<T> mode_;

  std::vector<T> items_;
  std::vector<size_t> visible_;
  int cursor_ = 0;
  int list_top_ = 0;
  bool filter_active_ = false;
  std::string filter_query_;
  Input filter_input_;
  bool refreshing_ = false;
  unsigned long long generation_ = 0;
  unsigned long long detail_token_ = 0;

  std::string status_text_;
  StatusLevel status_level_ = StatusLevel::Info;
  std::chrono::steady_clock::time_point status_until_{};

  bool quit_ = false;
  std::optional<T> result_;
};

// Opens the real terminal, runs a selector on it and restores the terminal afterwards.
// Throws SelectorError when the terminal can not be initialized.
template <typename T>
SelectionResult<T> select_from_list(std::vector<T> items, const IItemRenderer<T>& renderer,
                                    SelectorOptions<T> options, const SelectorConfig& cfg) {
  Terminal terminal;
  NcursesTerminal term;
  Selector<T> selector(term, renderer, std::move(options), SelectorRuntime::from_config(cfg));
  return selector.run(std::move(items));
}
