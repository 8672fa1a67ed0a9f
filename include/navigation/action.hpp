#ifndef ACTION_HPP
#define ACTION_HPP

#include <cstdint>
#include <string>

enum class ActionType : uint8_t
{
    TURN     = 0,
    MOVE     = 1,
    BACKUP   = 2,
    COMPLETE = 3
};

/*** One planner decision, executed by the mapping controller ***/
struct Action
{
    ActionType type{ActionType::COMPLETE};
    double degrees{0.0};             // TURN: positive = right
    double heading_offset_deg{0.0};  // MOVE: turn before driving
    double distance_cm{0.0};         // MOVE / BACKUP

    static Action turn(double degrees)
    {
        Action a;
        a.type = ActionType::TURN;
        a.degrees = degrees;
        return a;
    }

    static Action move(double heading_offset_deg, double distance_cm)
    {
        Action a;
        a.type = ActionType::MOVE;
        a.heading_offset_deg = heading_offset_deg;
        a.distance_cm = distance_cm;
        return a;
    }

    static Action backup(double distance_cm)
    {
        Action a;
        a.type = ActionType::BACKUP;
        a.distance_cm = distance_cm;
        return a;
    }

    static Action complete() { return Action(); }

    std::string toString() const;
};

#endif // ACTION_HPP
