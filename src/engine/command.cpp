#include "command.h"

static inline bool is_move(Command::Type t) {
    return t == Command::Type::MOVE_UP || t == Command::Type::MOVE_DOWN ||
           t == Command::Type::MOVE_LEFT || t == Command::Type::MOVE_RIGHT;
}

bool command_from_name(const std::string& name, Command& out)
{
    if (name == "move_up") out.type = Command::Type::MOVE_UP;
    else if (name == "move_down") out.type = Command::Type::MOVE_DOWN;
    else if (name == "move_left") out.type = Command::Type::MOVE_LEFT;
    else if (name == "move_right") out.type = Command::Type::MOVE_RIGHT;
    else return false;
    return true;
}

void queue_command(const Command& c, std::vector<Command>& command_stack)
{
    if (is_move(c.type)) {
        for (const auto& ex : command_stack) {
            if (ex.type == c.type) return; // already queued
        }
        command_stack.push_back(c);
        return;
    }
    command_stack.push_back(c);
}
