#include "Robot_sm.h"
#include <iostream>
#include <optional>

using namespace TSM::Generated::Robot;

/**
 * @brief Host object driving the generated Robot table
 *
 * The table only answers "where would this event lead". Each command looks
 * up the target, evaluates its own guard and runs its action, and commits
 * the new state last.
 */
class RobotController {
public:
    State state() const {
        return state_;
    }

    int position() const {
        return currentPosition_;
    }

    int obstacleCount() const {
        return obstacleCount_;
    }

    void setPosition(int position) {
        currentPosition_ = position;
    }

    void powerOn() {
        auto next = processEvent(state_, Event::PowerOn);
        if (!next) {
            return;
        }

        std::cout << "  [Action] Engaging motors (battery: " << battery_ << "%)" << std::endl;
        std::cout << "  [State] Robot ready" << std::endl;
        state_ = *next;
    }

    void powerOff() {
        auto next = processEvent(state_, Event::PowerOff);
        if (!next) {
            return;
        }

        std::cout << "  [State] Robot powered off" << std::endl;
        currentPosition_ = 0;
        targetPosition_.reset();
        obstacleCount_ = 0;
        state_ = *next;
    }

    void moveTo(int position) {
        auto next = processEvent(state_, Event::MoveTo);
        if (!next) {
            return;
        }

        targetPosition_ = position;
        movementTicks_ = 0;
        std::cout << "  [Action] Moving to position " << position << " from " << currentPosition_ << std::endl;
        state_ = *next;
    }

    void tick() {
        auto next = processEvent(state_, Event::Tick);
        if (!next) {
            return;
        }

        movementTicks_++;
        std::cout << "  [Internal] Movement tick " << movementTicks_ << " (still " << *next << ")" << std::endl;
        state_ = *next;
    }

    void checkPosition() {
        if (!targetPosition_) {
            return;
        }

        if (currentPosition_ != *targetPosition_) {
            std::cout << "  [Info] Target not reached yet" << std::endl;
            return;
        }

        auto next = processEvent(state_, Event::Arrive);
        if (!next) {
            return;
        }

        std::cout << "  [Info] Position reached: " << currentPosition_ << std::endl;
        targetPosition_.reset();
        state_ = *next;
    }

    void obstacleDetected() {
        auto next = processEvent(state_, Event::ObstacleDetected);
        if (!next) {
            return;
        }

        obstacleCount_++;
        std::cout << "  [State] Obstacle detected, waiting... (count: " << obstacleCount_ << ")" << std::endl;
        state_ = *next;
    }

    void tryClearObstacle() {
        auto next = processEvent(state_, Event::ObstacleClear);
        if (!next) {
            return;
        }

        if (obstacleCount_ >= MAX_OBSTACLES) {
            std::cout << "  [Guard] Too many obstacles, cannot continue" << std::endl;
            return;
        }

        std::cout << "  [State] Resuming movement" << std::endl;
        state_ = *next;
    }

    void emergencyStop() {
        auto next = processEvent(state_, Event::EmergencyStop);
        if (!next) {
            std::cout << "  [Ignored] EmergencyStop has no effect in " << state_ << std::endl;
            return;
        }

        std::cout << "  [State] EMERGENCY STOP ACTIVATED" << std::endl;
        state_ = *next;
    }

    void tryReset() {
        auto next = processEvent(state_, Event::Reset);
        if (!next) {
            return;
        }

        if (battery_ <= MIN_RESET_BATTERY) {
            std::cout << "  [Guard] Insufficient power to reset" << std::endl;
            return;
        }

        std::cout << "  [State] Robot ready" << std::endl;
        state_ = *next;
    }

private:
    static constexpr int MAX_OBSTACLES = 3;
    static constexpr int MIN_RESET_BATTERY = 10;

    State state_ = kInitialState;
    int currentPosition_ = 0;
    std::optional<int> targetPosition_;
    int obstacleCount_ = 0;
    int battery_ = 100;
    int movementTicks_ = 0;
};

int main() {
    RobotController robot;

    std::cout << "=== Startup Sequence ===" << std::endl;
    std::cout << "Current state: " << robot.state() << "\n" << std::endl;

    std::cout << "Command: PowerOn" << std::endl;
    robot.powerOn();

    std::cout << "\n=== Normal Operation ===" << std::endl;
    std::cout << "Command: MoveTo(100)" << std::endl;
    robot.moveTo(100);

    std::cout << "Command: Tick (internal transition)" << std::endl;
    robot.tick();
    robot.tick();
    robot.tick();

    std::cout << "Command: Check position" << std::endl;
    robot.setPosition(100);
    robot.checkPosition();

    std::cout << "\n=== Obstacle Handling ===" << std::endl;
    std::cout << "Command: MoveTo(200)" << std::endl;
    robot.moveTo(200);
    std::cout << "Command: ObstacleDetected" << std::endl;
    robot.obstacleDetected();
    std::cout << "Command: ObstacleClear" << std::endl;
    robot.tryClearObstacle();
    std::cout << "Command: Check position" << std::endl;
    robot.setPosition(200);
    robot.checkPosition();

    std::cout << "\n=== Emergency Stop ===" << std::endl;
    std::cout << "Command: MoveTo(300)" << std::endl;
    robot.moveTo(300);
    std::cout << "Command: EmergencyStop (any active state)" << std::endl;
    robot.emergencyStop();
    std::cout << "Command: Reset (requires power)" << std::endl;
    robot.tryReset();

    std::cout << "\n=== Wildcard Transition ===" << std::endl;
    std::cout << "Command: PowerOff" << std::endl;
    robot.powerOff();
    std::cout << "Command: EmergencyStop while off" << std::endl;
    robot.emergencyStop();

    std::cout << "\nFinal state: " << robot.state() << std::endl;
    std::cout << "Final position: " << robot.position() << std::endl;
    std::cout << "Total obstacles encountered: " << robot.obstacleCount() << std::endl;
    return 0;
}
