/**
 * @file ColonyView.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AntTypes.h"
#include "Hive.h"
#include "Insect.h"
#include "Logger.h"
#include "Place.h"

#include <algorithm>
#include <stdexcept>

// Last: curses defines function-like macros (move, clear) that clash with the standard headers.
#include "ColonyView.h"

namespace {
constexpr int CellWidth = 7;    // "[Th+ 2]"
constexpr int RowSpacing = 2;
constexpr int PairAnt = 1;
constexpr int PairBee = 2;
constexpr int PairWater = 3;
constexpr int PairNote = 4;
}

/** @copydoc ColonyView::ColonyView */
ColonyView::ColonyView(AntColony& c, WINDOW* w) : colony(c), win(w) {
    for (Place* entrance : colony.beeEntrances()) {
        std::vector<Place*> row;
        for (Place* p = entrance; p && p != &colony.queen(); p = p->exit()) row.push_back(p);
        rows.push_back(row);
    }
}

/** @copydoc ColonyView::initColors */
void ColonyView::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(PairAnt, COLOR_GREEN, -1);
    init_pair(PairBee, COLOR_YELLOW, -1);
    init_pair(PairWater, COLOR_BLUE, -1);
    init_pair(PairNote, COLOR_RED, -1);
}

/** @copydoc ColonyView::cellCode */
std::string ColonyView::cellCode(const Place& place) {
    const auto& ant = place.ant();
    if (!ant) return "  ";
    std::string code = ant->name().substr(0, 2);
    if (code.size() < 2) code += ' ';
    return code;
}

Place* ColonyView::cursorPlace() const {
    if (rows.empty() || rows[(size_t)curRow].empty()) return nullptr;
    return rows[(size_t)curRow][(size_t)curCol];
}

void ColonyView::drawCell(int row, int col) {
    const Place& p = *rows[(size_t)row][(size_t)col];
    const int y = 1 + row * RowSpacing;
    const int x = col * CellWidth;
    const bool here = (row == curRow && col == curCol);
    if (here) wattron(win, A_REVERSE);
    if (p.isWater()) wattron(win, COLOR_PAIR(PairWater));
    mvwaddch(win, y, x, p.isWater() ? '~' : '[');
    if (p.isWater()) wattroff(win, COLOR_PAIR(PairWater));

    wattron(win, COLOR_PAIR(PairAnt) | A_BOLD);
    mvwprintw(win, y, x + 1, "%s", cellCode(p).c_str());
    wattroff(win, COLOR_PAIR(PairAnt) | A_BOLD);
    const bool shelters = p.ant() && p.ant()->containedAnt();
    mvwaddch(win, y, x + 3, shelters ? '+' : ' ');

    const size_t n = p.bees().size();
    wattron(win, COLOR_PAIR(PairBee));
    if (n == 0) mvwprintw(win, y, x + 4, "  ");
    else if (n < 100) mvwprintw(win, y, x + 4, "%2zu", n);
    else mvwprintw(win, y, x + 4, "**");
    wattroff(win, COLOR_PAIR(PairBee));

    if (p.isWater()) wattron(win, COLOR_PAIR(PairWater));
    mvwaddch(win, y, x + 6, p.isWater() ? '~' : ']');
    if (p.isWater()) wattroff(win, COLOR_PAIR(PairWater));
    if (here) wattroff(win, A_REVERSE);
}

void ColonyView::drawStatusLine() {
    int maxY, maxX; getmaxyx(win, maxY, maxX);
    (void)maxX;
    const AntTypeInfo& type = antTypes()[selected];
    std::string status = "Food:" + std::to_string(colony.food()) +
                         " Time:" + std::to_string(colony.time()) +
                         " Ant:" + type.name + "(" + std::to_string(type.foodCost) + ")";
    if (Place* p = cursorPlace()) status += " @" + p->name();
    status += " | arrows [ ] d x space q";
    wmove(win, maxY - 2, 0); wclrtoeol(win);
    if (!note.empty()) {
        wattron(win, COLOR_PAIR(PairNote));
        mvwprintw(win, maxY - 2, 0, "%s", note.c_str());
        wattroff(win, COLOR_PAIR(PairNote));
    }
    wmove(win, maxY - 1, 0); wclrtoeol(win);
    mvwprintw(win, maxY - 1, 0, "%s", status.c_str());
}

/** @copydoc ColonyView::draw */
void ColonyView::draw() {
    mvwprintw(win, 0, 0, "Hive: %zu bees", colony.hive().bees().size());
    wclrtoeol(win);
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) drawCell((int)r, (int)c);
        const int y = 1 + (int)r * RowSpacing;
        mvwprintw(win, y, (int)rows[r].size() * CellWidth, " Queen");
    }
    drawStatusLine();
    wrefresh(win);
}

void ColonyView::moveCursor(int dRow, int dCol) {
    if (rows.empty()) return;
    curRow = std::max(0, std::min((int)rows.size() - 1, curRow + dRow));
    const int width = (int)rows[(size_t)curRow].size();
    curCol = std::max(0, std::min(width - 1, curCol + dCol));
}

void ColonyView::deploySelected() {
    Place* p = cursorPlace();
    if (!p) return;
    const AntTypeInfo& type = antTypes()[selected];
    try {
        if (colony.deployAnt(p->name(), type.name)) note = std::string();
        else note = std::string("Not enough food for ") + type.name;
    } catch (const std::logic_error& e) {
        // The colony is unchanged when a placement is refused.
        Logger::warn(std::string("placement refused: ") + e.what());
        note = e.what();
    }
}

void ColonyView::removeAtCursor() {
    Place* p = cursorPlace();
    if (!p) return;
    colony.removeAnt(p->name());
    note = std::string();
}

/** @copydoc ColonyView::runTurnInput */
bool ColonyView::runTurnInput(const volatile sig_atomic_t& stopFlag) {
    while (!stopFlag) {
        draw();
        int ch = wgetch(win);
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested");
                return false;
            case ' ': case '\n': case '\r': case KEY_ENTER:
                note = std::string();
                return true;
            case KEY_UP: moveCursor(-1, 0); break;
            case KEY_DOWN: moveCursor(1, 0); break;
            case KEY_LEFT: moveCursor(0, -1); break;
            case KEY_RIGHT: moveCursor(0, 1); break;
            case '[':
                selected = (selected + antTypes().size() - 1) % antTypes().size();
                break;
            case ']':
                selected = (selected + 1) % antTypes().size();
                break;
            case 'd': case 'D': deploySelected(); break;
            case 'x': case 'X': removeAtCursor(); break;
            default: break;
        }
    }
    return false;
}

/** @copydoc ColonyView::showResult */
void ColonyView::showResult(AntColony::State state, const volatile sig_atomic_t& stopFlag) {
    switch (state) {
        case AntColony::State::Won: note = "All bees are vanquished. You win! (any key)"; break;
        case AntColony::State::Lost: note = "The ant queen has perished. Please try again. (any key)"; break;
        case AntColony::State::Running: return;
    }
    draw();
    while (!stopFlag && wgetch(win) == ERR) {}
}
