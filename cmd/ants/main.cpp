/**
 * @file main.cpp
 * @brief Ants vs. SomeBees entry: reads options, initializes ncurses, runs the colony and shuts down cleanly.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include "AntColony.h"
#include "GameConfig.h"
#include "Hive.h"
#include "Logger.h"
#include "ColonyView.h"
#include <ncurses.h>

static volatile sig_atomic_t g_stop = 0;
static void handle_signal(int) { g_stop = 1; }

static bool g_curses_inited = false;
static void atexit_cleanup() {
    if (g_curses_inited) {
        endwin();
        g_curses_inited = false;
    }
}

// Handle terminal suspension (Ctrl+Z): restore tty before stopping.
static void handle_sigtstp(int) {
    if (g_curses_inited) {
        def_prog_mode();
        endwin();
        g_curses_inited = false;
    }
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTSTP, &sa, nullptr);
    raise(SIGTSTP);
}

// Resume after suspension: restore curses program mode; the input loop redraws on its next tick.
static void handle_sigcont(int) {
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    reset_prog_mode();
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    timeout(100);
    clearok(stdscr, TRUE);
    refresh();
    g_curses_inited = true;
}

int main(int argc, char** argv) {
    const std::string prog = (argc > 0) ? argv[0] : "ants";
    Logger::initFromArgv0(prog.c_str());
    Logger::info("ants starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (ants)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (ants)"); }
            } else {
                Logger::error("std::terminate (ants): no active exception");
            }
        } catch (...) {}
        if (g_curses_inited) { endwin(); }
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    GameConfig cfg = loadGameConfig(argc, argv);
    if (cfg.showHelp) {
        std::fputs(usageText(prog).c_str(), stdout);
        Logger::shutdown();
        return 0;
    }
    Logger::info("config: food=" + std::to_string(cfg.food) + " seed=" + std::to_string(cfg.seed) +
                 " layout=" + std::to_string((int)cfg.layout) + " plan=" + std::to_string((int)cfg.plan));

    struct sigaction sa{};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    struct sigaction st{}; st.sa_handler = handle_sigtstp; sigemptyset(&st.sa_mask); st.sa_flags = 0; sigaction(SIGTSTP, &st, nullptr);
    struct sigaction sc{}; sc.sa_handler = handle_sigcont; sigemptyset(&sc.sa_mask); sc.sa_flags = 0; sigaction(SIGCONT, &sc, nullptr);

    initscr();
    g_curses_inited = true;
    std::atexit(atexit_cleanup);
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    timeout(100);
    ColonyView::initColors();

    std::unique_ptr<ColonyView> view;
    AntColony colony(
        [&view](AntColony& c) {
            if (!view->runTurnInput(g_stop)) c.halt();
        },
        std::make_unique<Hive>(makeAssaultPlan(cfg)), makeLayout(cfg), cfg.food, cfg.seed);
    view = std::make_unique<ColonyView>(colony, stdscr);

    AntColony::State result = colony.simulate();
    view->showResult(result, g_stop);

    endwin();
    g_curses_inited = false;
    Logger::info("ants terminating");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logException("unhandled exception (ants)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        if (g_curses_inited) { endwin(); g_curses_inited = false; }
        Logger::logUnknownException("unhandled exception (ants)");
        Logger::shutdown();
        return 2;
    }
}
