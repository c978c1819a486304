/**
 * @file ColonyView.h
 * @brief Declares ColonyView, the ncurses renderer and interactive placement strategy for a colony.
 *
 * Each bee entrance starts one row of cells that follows exits to the colony queen. A cell shows the
 * visible ant's two-letter code ('+' when it shelters another ant) and the number of bees present;
 * water cells are drawn in blue. The bottom line carries food, time, the selected ant type and keys.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <csignal>
#include <string>
#include <vector>

#include "AntColony.h"

#include <ncurses.h>

class Place;

/**
 * @class ColonyView
 * @brief Draws the tunnels of an AntColony and turns key presses into deploy/remove calls.
 */
class ColonyView {
public:
    /** @brief Build the tunnel rows of @p colony; drawing goes to @p win. */
    ColonyView(AntColony& colony, WINDOW* win);

    /** @brief Redraw every tunnel cell, the note line and the status line. */
    void draw();
    /** @brief Register color pairs used by the view; call after start_color. */
    static void initColors();

    /**
     * @brief Read keys until the player ends the turn.
     *
     * Returns true when the turn ends (space/Enter) and false when the player quits ('q') or
     * @p stopFlag is raised by a signal handler.
     */
    bool runTurnInput(const volatile sig_atomic_t& stopFlag);

    /** @brief Draw the final board with a message for @p state and wait for a key or @p stopFlag. */
    void showResult(AntColony::State state, const volatile sig_atomic_t& stopFlag);

    /** @brief Two-letter display code for the ant at @p place ("  " when empty). */
    static std::string cellCode(const Place& place);

private:
    void drawCell(int row, int col);
    void drawStatusLine();
    void moveCursor(int dRow, int dCol);
    void deploySelected();
    void removeAtCursor();
    Place* cursorPlace() const;

    AntColony& colony;
    WINDOW* win;
    std::vector<std::vector<Place*>> rows; /**< tunnel rows, entrance first */
    int curRow{0};
    int curCol{0};
    size_t selected{1};                    /**< index into antTypes(); starts on Thrower */
    std::string note;                      /**< last feedback message */
};
