/**
 * @file ctxhub_main.cpp
 * @brief ctxhub: context coordination daemon and its command-line front end.
 *
 * ## Usage
 *
 *     ctxhub [--project-root DIR] [--config FILE] [--fallback] <command> [args]
 *
 *     start [--foreground|--background]   Run the daemon (foreground is the default)
 *     stop                                SIGTERM the running daemon and wait for it
 *     restart                             stop, then start in the background
 *     status                              Daemon status as JSON
 *     send <from> <to> <content> [--type T] [--priority P] [--subject S]
 *     messages [--context C] [--all] [--mark-read ID]
 *     rules                               Print the handoff-rule table
 *     spawn <ctx> [--task TEXT]           Prepare (and launch) a session; prints JSON
 *     prompt <ctx> [--task TEXT]          Write the resume prompt file
 *     prompts                             Print every context's resume text
 *     audit [--quick]                     Health audit; exit 1 on critical issues
 *     context                             Active context and activity from the daemon status
 *
 * Exit status is 0 on success and 1 on any failure.
 */

#include "activity_tracker.hpp"
#include "context_registry.hpp"
#include "daemon_lifecycle.hpp"
#include "file_activity_watcher.hpp"
#include "health_audit.hpp"
#include "mailbox.hpp"
#include "message_store.hpp"
#include "session_coordinator.hpp"
#include "status_store.hpp"

#include "ctxhub_service.hpp"
#include "utils/ctxhub_config.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace ctxhub::utils;
using namespace ctxhub::coord;
namespace fs = std::filesystem;

namespace
{

constexpr std::chrono::seconds kStopWait{10};

struct CliArgs
{
    fs::path project_root;
    fs::path config_path;
    bool fallback{false};

    std::string command;
    std::vector<std::string> positional;

    bool background{false};
    bool all{false};
    bool quick{false};
    std::optional<std::string> type;
    std::optional<std::string> priority;
    std::optional<std::string> subject;
    std::optional<std::string> context;
    std::optional<std::string> task;
    std::optional<std::string> mark_read;
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " [--project-root DIR] [--config FILE] [--fallback] <command> [args]\n\n"
        << "Commands:\n"
        << "  start [--foreground|--background]   Run the daemon (foreground by default)\n"
        << "  stop                                Stop the running daemon\n"
        << "  restart                             Stop, then start in the background\n"
        << "  status                              Print daemon status (JSON)\n"
        << "  send <from> <to> <content> [--type T] [--priority low|normal|high|urgent]\n"
        << "       [--subject S]                  Send a handoff message\n"
        << "  messages [--context C] [--all] [--mark-read ID]\n"
        << "                                      List or acknowledge messages\n"
        << "  rules                               Show handoff rules\n"
        << "  spawn <ctx> [--task TEXT]           Prepare a session for a context\n"
        << "  prompt <ctx> [--task TEXT]          Write the resume prompt file\n"
        << "  prompts                             Print all resume prompts\n"
        << "  audit [--quick]                     Run the health audit\n"
        << "  context                             Show the active context\n\n"
        << "Options:\n"
        << "  --project-root DIR  Project checkout (default: current directory)\n"
        << "  --config FILE       Configuration file (replaces config/ctxhub.*.json)\n"
        << "  --fallback          Use the fallback port set\n"
        << "  --version           Print the version and exit\n"
        << "  --help              Show this message\n";
}

/// Parses argv; returns nullopt after printing an error.
std::optional<CliArgs> parse_args(int argc, char *argv[])
{
    CliArgs args;
    auto need_value = [&](int &i, std::string_view flag) -> std::optional<std::string>
    {
        if (i + 1 >= argc)
        {
            std::cerr << "Error: " << flag << " needs a value\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--version")
        {
            std::cout << "ctxhub " << ctxhub::platform::get_version_string() << "\n";
            std::exit(0);
        }

        std::optional<std::string> *target = nullptr;
        if (arg == "--project-root" || arg == "--config")
        {
            auto v = need_value(i, arg);
            if (!v)
                return std::nullopt;
            (arg == "--config" ? args.config_path : args.project_root) = *v;
            continue;
        }
        if (arg == "--fallback")
            args.fallback = true;
        else if (arg == "--background")
            args.background = true;
        else if (arg == "--foreground")
            args.background = false;
        else if (arg == "--all")
            args.all = true;
        else if (arg == "--quick")
            args.quick = true;
        else if (arg == "--type")
            target = &args.type;
        else if (arg == "--priority")
            target = &args.priority;
        else if (arg == "--subject")
            target = &args.subject;
        else if (arg == "--context")
            target = &args.context;
        else if (arg == "--task")
            target = &args.task;
        else if (arg == "--mark-read")
            target = &args.mark_read;
        else if (arg.starts_with("--"))
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return std::nullopt;
        }
        else if (args.command.empty())
            args.command = std::string(arg);
        else
            args.positional.emplace_back(arg);

        if (target != nullptr)
        {
            auto v = need_value(i, arg);
            if (!v)
                return std::nullopt;
            *target = std::move(*v);
        }
    }

    if (args.command.empty())
    {
        std::cerr << "Error: a command is required\n\n";
        print_usage(argv[0]);
        return std::nullopt;
    }
    return args;
}

Logger::Level parse_level(const std::string &level)
{
    if (level == "trace")
        return Logger::Level::L_TRACE;
    if (level == "debug")
        return Logger::Level::L_DEBUG;
    if (level == "warning")
        return Logger::Level::L_WARNING;
    if (level == "error")
        return Logger::Level::L_ERROR;
    if (level == "system")
        return Logger::Level::L_SYSTEM;
    return Logger::Level::L_INFO;
}

/// Everything a command needs, built once after configuration is loaded.
struct App
{
    App(const ctxhub::CtxhubSettings &s, const CliArgs &a, ContextRegistry reg)
        : settings(s), args(a), registry(std::move(reg)),
          store(s.data_dir / ".ctxhub_messages.json", s.mailbox_max_messages),
          mailbox(registry, store), status_store(s.data_dir / ".ctxhub_status.json"),
          coordinator(registry, mailbox, s.project_root),
          auditor(registry,
                  AuditPaths{s.project_root, s.data_dir, s.data_dir / ".ctxhub_messages.json"},
                  s.audit_max_context_lines)
    {
    }

    const ctxhub::CtxhubSettings &settings;
    const CliArgs &args;
    ContextRegistry registry;
    FileMessageStore store;
    Mailbox mailbox;
    StatusStore status_store;
    SessionCoordinator coordinator;
    HealthAuditor auditor;

    DaemonOptions daemon_options() const
    {
        const PortSet ports = registry.ports(args.fallback);
        DaemonOptions o;
        o.pid_file = settings.data_dir / ".ctxhub_daemon.pid";
        o.status_file = settings.data_dir / ".ctxhub_status.json";
        o.tick = settings.tick;
        o.poll_interval = settings.poll_interval;
        o.health_interval = settings.health_interval;
        o.cleanup_interval = settings.cleanup_interval;
        o.static_data = {{"mode", args.fallback ? "fallback" : "normal"},
                         {"ports", {{"backend", ports.backend}, {"frontend", ports.frontend}}},
                         {"project_root", settings.project_root.string()}};
        return o;
    }

    std::unique_ptr<Detacher> make_detacher() const
    {
        PosixDoubleForkDetacher::Options o;
        o.executable = ctxhub::platform::get_executable_name(true);
        o.args = {"--project-root", settings.project_root.string()};
        if (!args.config_path.empty())
        {
            o.args.push_back("--config");
            o.args.push_back(fs::absolute(args.config_path).string());
        }
        if (args.fallback)
            o.args.push_back("--fallback");
        o.args.push_back("start");
        o.args.push_back("--foreground");
        o.stdout_file = settings.data_dir / "ctxhub_daemon.out";
        o.stderr_file = settings.data_dir / "ctxhub_daemon.err";
        o.working_dir = settings.project_root;
        return std::make_unique<PosixDoubleForkDetacher>(std::move(o));
    }

    /// Active context as last recorded by the daemon.
    std::optional<std::string> recorded_active_context() const
    {
        auto st = status_store.read();
        if (!st)
            return std::nullopt;
        auto it = st->data.find("active_context");
        if (it == st->data.end() || !it->is_string())
            return std::nullopt;
        return it->get<std::string>();
    }
};

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_start(App &app)
{
    if (app.args.background)
    {
        DaemonLifecycle daemon(app.daemon_options(), app.make_detacher());
        std::cout << "Starting ctxhub daemon in background...\n";
        auto r = daemon.start(false);
        if (r.is_error())
        {
            std::cerr << "Error: " << r.error_message() << "\n";
            return 1;
        }
        std::cout << daemon.status().dump(2) << "\n";
        return 0;
    }

    const auto &s = app.settings;
    std::error_code ec;
    if (!Logger::instance().set_rotating_logfile(s.log_file, s.log_max_size_bytes,
                                                 s.log_max_backups, ec))
    {
        std::cerr << "Warning: cannot log to " << s.log_file.string() << ": " << ec.message()
                  << "; logging to the console\n";
    }
    ctxhub::CtxhubConfig::get_instance().log_summary();

    ActivityTracker tracker(app.registry, s.activity_window, s.activity_buffer_size);
    FileActivityWatcher watcher(tracker, s.debounce);
    for (const auto &ci : app.registry.contexts())
        watcher.add_context(ci.id, app.registry.watch_dirs(s.project_root, ci.id));

    DaemonLifecycle daemon(app.daemon_options(), app.make_detacher());
    daemon.set_health_scorer(
        [&app]()
        {
            const HealthReport report = app.auditor.run(true);
            return HealthScore{report.score, report.critical, report.warnings};
        });
    daemon.set_cleanup_task([]() { LOGGER_INFO("[daemon] scheduled cleanup complete"); });
    daemon.set_status_provider(
        [&tracker]()
        {
            const auto active = tracker.active_context();
            return nlohmann::json{
                {"active_context", active ? nlohmann::json(*active) : nlohmann::json(nullptr)},
                {"activity", tracker.summary_json()}};
        });
    daemon.set_hooks(
        [&watcher]()
        {
            std::error_code wec;
            if (!watcher.start(&wec))
                LOGGER_WARN("[daemon] file watcher unavailable: {}", wec.message());
        },
        [&watcher]() { watcher.stop(); });

    std::cout << "Starting ctxhub daemon in foreground (PID " << ctxhub::platform::get_pid()
              << ")...\n";
    auto r = daemon.start(true);
    if (r.is_error())
    {
        std::cerr << "Error: " << r.error_message() << "\n";
        return 1;
    }
    return r.content() == StartOutcome::Faulted ? 1 : 0;
}

int cmd_stop(App &app)
{
    DaemonLifecycle daemon(app.daemon_options());
    auto r = daemon.stop_running(kStopWait);
    if (r.is_error())
    {
        std::cerr << r.error_message() << "\n";
        return 1;
    }
    std::cout << "Daemon stopped (PID " << r.content() << ")\n";
    return 0;
}

int cmd_restart(App &app)
{
    DaemonLifecycle daemon(app.daemon_options(), app.make_detacher());
    auto r = daemon.restart(kStopWait);
    if (r.is_error())
    {
        std::cerr << "Error: " << r.error_message() << "\n";
        return 1;
    }
    std::cout << daemon.status().dump(2) << "\n";
    return 0;
}

int cmd_status(App &app)
{
    DaemonLifecycle daemon(app.daemon_options());
    std::cout << daemon.status().dump(2) << "\n";
    return 0;
}

int cmd_send(App &app)
{
    const auto &a = app.args;
    if (a.positional.size() != 3)
    {
        std::cerr << "Usage: send <from> <to> <content> [--type T] [--priority P] [--subject S]\n";
        return 1;
    }
    Priority priority = Priority::Normal;
    if (a.priority)
    {
        auto p = parse_priority(*a.priority);
        if (!p)
        {
            std::cerr << "Error: unknown priority '" << *a.priority
                      << "' (low, normal, high, urgent)\n";
            return 1;
        }
        priority = *p;
    }

    auto r = app.coordinator.send(a.positional[0], a.positional[1], a.type.value_or("info"),
                                  a.positional[2], priority, a.subject.value_or(""));
    if (r.is_error())
    {
        std::cerr << "Error (" << to_string(r.error()) << "): " << r.error_message() << "\n";
        return 1;
    }
    const Message &m = r.content();
    std::cout << fmt::format("Message #{} sent: {} -> {} [{}]\n", m.id, m.from, m.to, m.type);
    return 0;
}

void print_message(const Message &m)
{
    std::cout << fmt::format("#{} [{}] {} -> {} ({}){}\n    {}\n    {}\n", m.id,
                             to_string(m.priority), m.from, m.to, m.type,
                             m.is_read() ? " read" : "", m.subject, m.content);
}

int cmd_messages(App &app)
{
    const auto &a = app.args;
    if (a.mark_read)
    {
        uint64_t id = 0;
        const auto &text = *a.mark_read;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            std::cerr << "Error: --mark-read needs a message id\n";
            return 1;
        }
        std::error_code store_ec;
        const bool changed = app.mailbox.mark_read(id, &store_ec);
        if (store_ec)
        {
            std::cerr << "Error: " << store_ec.message() << "\n";
            return 1;
        }
        std::cout << (changed ? fmt::format("Message #{} marked read\n", id)
                              : fmt::format("Message #{} unchanged\n", id));
        return 0;
    }

    std::vector<Message> list;
    std::error_code ec;
    if (a.context)
    {
        if (!app.registry.contains(*a.context))
        {
            std::cerr << "Error: Unknown context: " << *a.context << "\n";
            return 1;
        }
        list = app.mailbox.inbox(*a.context, !a.all, &ec);
    }
    else
    {
        for (auto &m : app.store.all(&ec))
        {
            if (a.all || !m.is_read())
                list.push_back(std::move(m));
        }
        sort_for_inbox(list);
    }
    if (ec)
        std::cerr << "Warning: message log unreadable (" << ec.message() << ")\n";

    if (list.empty())
    {
        std::cout << "No messages.\n";
        return 0;
    }
    for (const auto &m : list)
        print_message(m);
    return 0;
}

int cmd_rules(App &app)
{
    const auto &reg = app.registry;
    std::cout << "Coordinator: " << (reg.coordinator().empty() ? "(none)" : reg.coordinator())
              << " (may send any type to any context)\n\n";
    for (const auto &[from, targets] : reg.rules())
    {
        std::cout << from << ":\n";
        for (const auto &[to, types] : targets)
        {
            std::cout << "  -> " << to << ":";
            for (const auto &t : types)
                std::cout << " " << t;
            std::cout << "\n";
        }
    }
    return 0;
}

void wire_activity(App &app)
{
    app.coordinator.set_activity_sources(
        [&app]() { return app.recorded_active_context(); },
        [&app]()
        {
            auto st = app.status_store.read();
            if (!st || !st->data.contains("activity"))
                return nlohmann::json::object();
            return st->data["activity"];
        });
}

int cmd_spawn(App &app)
{
    if (app.args.positional.size() != 1)
    {
        std::cerr << "Usage: spawn <context> [--task TEXT]\n";
        return 1;
    }
    auto r = app.coordinator.spawn(app.args.positional[0], app.args.task,
                                   app.settings.editor_command);
    if (r.is_error())
    {
        std::cout << nlohmann::json{{"success", false}, {"error", r.error_message()}}.dump(2)
                  << "\n";
        return 1;
    }
    std::cout << r.content().to_json().dump(2) << "\n";
    return 0;
}

int cmd_prompt(App &app)
{
    if (app.args.positional.size() != 1)
    {
        std::cerr << "Usage: prompt <context> [--task TEXT]\n";
        return 1;
    }
    auto r = app.coordinator.write_prompt(app.args.positional[0], app.args.task);
    if (r.is_error())
    {
        std::cerr << "Error: " << r.error_message() << "\n";
        return 1;
    }
    std::cout << "Prompt written to " << r.content().string() << "\n";
    return 0;
}

int cmd_prompts(App &app)
{
    for (const auto &ci : app.registry.contexts())
    {
        auto r = app.coordinator.resume_text(ci.id);
        std::cout << "=== " << ci.id << " ===\n"
                  << (r.is_ok() ? r.content() : r.error_message()) << "\n\n";
    }
    return 0;
}

int cmd_audit(App &app)
{
    const HealthReport report = app.auditor.run(app.args.quick);
    std::cout << report.summary() << "\n";
    for (const auto &i : report.issues)
        std::cout << fmt::format("  [{}] {}: {}\n", to_string(i.severity), i.component,
                                 i.message);
    return report.critical == 0 ? 0 : 1;
}

int cmd_context(App &app)
{
    auto st = app.status_store.read();
    if (!st)
    {
        std::cout << "No daemon status recorded; start the daemon to track activity.\n";
        return 0;
    }
    const auto active = app.coordinator.active_context();
    std::cout << "Active context: " << active.value_or("none") << "\n"
              << "Daemon state: " << to_string(st->state) << " (updated " << st->last_update
              << ")\n"
              << app.coordinator.activity_summary().dump(2) << "\n";
    return 0;
}

/// Runs the command named on the command line; nullopt when the name is unknown.
std::optional<int> dispatch(App &app)
{
    const std::string &cmd = app.args.command;
    if (cmd == "start")
        return cmd_start(app);
    if (cmd == "stop")
        return cmd_stop(app);
    if (cmd == "restart")
        return cmd_restart(app);
    if (cmd == "status")
        return cmd_status(app);
    if (cmd == "send")
        return cmd_send(app);
    if (cmd == "messages")
        return cmd_messages(app);
    if (cmd == "rules")
        return cmd_rules(app);
    if (cmd == "spawn")
        return cmd_spawn(app);
    if (cmd == "prompt")
        return cmd_prompt(app);
    if (cmd == "prompts")
        return cmd_prompts(app);
    if (cmd == "audit")
        return cmd_audit(app);
    if (cmd == "context")
        return cmd_context(app);
    return std::nullopt;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    auto parsed = parse_args(argc, argv);
    if (!parsed)
        return 1;
    const CliArgs &args = *parsed;

    ctxhub::CtxhubConfig::set_project_root(args.project_root);
    ctxhub::CtxhubConfig::set_config_path(args.config_path);

    LifecycleGuard app_lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                                FileLock::GetLifecycleModule(),
                                                JsonStore::GetLifecycleModule(),
                                                ctxhub::CtxhubConfig::GetLifecycleModule()));

    const auto &settings = ctxhub::CtxhubConfig::get_instance().settings();
    const bool daemon_run = args.command == "start" && !args.background;
    Logger::Level level = parse_level(settings.log_level);
    if (!daemon_run && !settings.debug && level < Logger::Level::L_WARNING)
        level = Logger::Level::L_WARNING; // keep CLI output readable
    Logger::instance().set_level(level);
    if (!daemon_run)
    {
        Logger::instance().set_log_sink_messages_enabled(false);
        if (settings.debug)
            ctxhub::CtxhubConfig::get_instance().log_summary();
    }

    std::optional<ContextRegistry> registry;
    try
    {
        registry.emplace(ContextRegistry::from_json_file(settings.registry_file));
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    try
    {
        App app(settings, args, std::move(*registry));
        wire_activity(app);
        if (const auto rc = dispatch(app))
            return *rc;
    }
    catch (const std::exception &e)
    {
        // The console already shows the error line; only the daemon log needs a record.
        if (daemon_run)
        {
            LOGGER_ERROR("[daemon] '{}' failed: {}", args.command, e.what());
            Logger::instance().flush();
        }
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage(argv[0]);
    return 1;
}
