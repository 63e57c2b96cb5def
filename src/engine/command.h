// Command queue between the GameEngine calls and the simulation step.
#pragma once

#include <string>
#include <vector>

struct Command {
    enum class Type {
        MOVE_UP, MOVE_DOWN, MOVE_LEFT, MOVE_RIGHT,
        ALT_MODE, BOOST_MODE, CONTROL_MODE,
        MOUSE_TARGET,
        START_AUTOFIRE, STOP_AUTOFIRE,
        START_TRACKING, STOP_TRACKING,
    } type{Type::MOVE_UP};
    double a = 0.0;     // MOUSE_TARGET: logical screen x
    double b = 0.0;     // MOUSE_TARGET: logical screen y
    bool on = false;    // *_MODE payload
};

// "move_up" etc. Returns false for any other name.
bool command_from_name(const std::string& name, Command& out);

// Queue semantics:
// - MOVE_*: at most one per direction per tick (duplicates ignored)
// - everything else is appended in call order, so the last MOUSE_TARGET
//   before a shot is the one that shot aims with
void queue_command(const Command& c, std::vector<Command>& command_stack);
