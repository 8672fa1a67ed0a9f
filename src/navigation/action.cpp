#include "navigation/action.hpp"
#include <iomanip>
#include <sstream>

std::string Action::toString() const
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    switch (type) {
        case ActionType::TURN:
            ss << "TURN " << degrees << "°";
            break;
        case ActionType::MOVE:
            ss << "MOVE " << distance_cm << "cm @ " << heading_offset_deg << "°";
            break;
        case ActionType::BACKUP:
            ss << "BACKUP " << distance_cm << "cm";
            break;
        case ActionType::COMPLETE:
            ss << "COMPLETE";
            break;
    }
    return ss.str();
}
