#include "Item_sm.h"
#include "Player_sm.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>

// Both machines declare State and Event; each lives in its own namespace
namespace PlayerSM = TSM::Generated::Player;
namespace ItemSM = TSM::Generated::Item;

class LaserGun {
public:
    ItemSM::State state() const {
        return state_;
    }

    void draw() {
        auto next = ItemSM::processEvent(state_, ItemSM::Event::Draw);
        if (!next) {
            return;
        }

        std::cout << "Laser gun drawn (charge: " << charge_ << "%)" << std::endl;
        state_ = *next;
    }

    void holster() {
        auto next = ItemSM::processEvent(state_, ItemSM::Event::Holster);
        if (!next) {
            return;
        }

        std::cout << "Laser gun holstered" << std::endl;
        state_ = *next;
    }

    void fire() {
        auto next = ItemSM::processEvent(state_, ItemSM::Event::Fire);
        if (!next) {
            std::cout << "Cannot fire while " << state_ << std::endl;
            return;
        }

        if (charge_ < SHOT_COST) {
            std::cout << "Insufficient charge to fire" << std::endl;
            return;
        }

        charge_ -= SHOT_COST;
        std::cout << "Laser gun fires! (charge: " << charge_ << "%)" << std::endl;
        state_ = *next;
    }

    void cooldownComplete() {
        auto next = ItemSM::processEvent(state_, ItemSM::Event::CooldownComplete);
        if (!next) {
            return;
        }

        std::cout << "Weapon cooling complete, ready to fire" << std::endl;
        state_ = *next;
    }

    // Recharging is not an event of the item table
    void recharge() {
        if (charge_ < MAX_CHARGE) {
            charge_ = std::min(charge_ + 10, MAX_CHARGE);
            std::cout << "Laser gun recharging... (charge: " << charge_ << "%)" << std::endl;
        }
    }

private:
    static constexpr int MAX_CHARGE = 100;
    static constexpr int SHOT_COST = 20;

    ItemSM::State state_ = ItemSM::kInitialState;
    int charge_ = MAX_CHARGE;
};

class Player {
public:
    PlayerSM::State state() const {
        return state_;
    }

    float x() const {
        return x_;
    }

    bool hasItem() const {
        return item_ != nullptr;
    }

    void startWalking() {
        auto next = PlayerSM::processEvent(state_, PlayerSM::Event::StartWalking);
        if (!next) {
            return;
        }

        speed_ = 1.0f;
        std::cout << "Player starts walking (speed: " << speed_ << ")" << std::endl;
        state_ = *next;
    }

    void stopWalking() {
        auto next = PlayerSM::processEvent(state_, PlayerSM::Event::StopWalking);
        if (!next) {
            return;
        }

        speed_ = 0.0f;
        std::cout << "Player stops walking" << std::endl;
        state_ = *next;
    }

    void startRunning() {
        auto next = PlayerSM::processEvent(state_, PlayerSM::Event::StartRunning);
        if (!next) {
            return;
        }

        speed_ = 2.5f;
        std::cout << "Player starts running (speed: " << speed_ << ")" << std::endl;
        state_ = *next;
    }

    void stopRunning() {
        auto next = PlayerSM::processEvent(state_, PlayerSM::Event::StopRunning);
        if (!next) {
            return;
        }

        speed_ = 0.0f;
        std::cout << "Player stops running" << std::endl;
        state_ = *next;
    }

    void updatePosition(float deltaTime) {
        if (speed_ > 0.0f) {
            x_ += speed_ * deltaTime;
            std::cout << std::fixed << std::setprecision(1) << "Player position: (" << x_ << ", " << y_ << ")"
                      << std::endl;
        }
    }

    void pickUpItem() {
        auto next = PlayerSM::processEvent(state_, PlayerSM::Event::PickUpItem);
        if (!next) {
            return;
        }

        if (item_) {
            std::cout << "Already holding an item" << std::endl;
            return;
        }

        item_ = std::make_unique<LaserGun>();
        std::cout << "Player picks up laser gun" << std::endl;
        state_ = *next;
    }

    void dropItem() {
        auto next = PlayerSM::processEvent(state_, PlayerSM::Event::DropItem);
        if (!next) {
            return;
        }

        if (!item_) {
            std::cout << "Not holding any item" << std::endl;
            return;
        }

        item_.reset();
        std::cout << "Player drops item" << std::endl;
        state_ = *next;
    }

    LaserGun *item() {
        return item_.get();
    }

private:
    PlayerSM::State state_ = PlayerSM::kInitialState;
    float x_ = 0.0f;
    float y_ = 0.0f;
    float speed_ = 0.0f;
    std::unique_ptr<LaserGun> item_;
};

int main() {
    Player player;

    std::cout << "=== Movement ===" << std::endl;
    player.startWalking();
    player.updatePosition(1.0f);
    player.stopWalking();

    std::cout << "\n=== Item Pickup ===" << std::endl;
    player.pickUpItem();

    std::cout << "\n=== Weapon Usage ===" << std::endl;
    if (LaserGun *gun = player.item()) {
        gun->fire();
        gun->draw();
        gun->fire();
        gun->cooldownComplete();
        gun->fire();
        gun->cooldownComplete();
    }

    std::cout << "\n=== Combat While Running ===" << std::endl;
    player.startRunning();
    player.updatePosition(0.5f);
    if (LaserGun *gun = player.item()) {
        gun->fire();
        gun->cooldownComplete();
    }
    player.updatePosition(0.5f);

    std::cout << "\n=== Recharge ===" << std::endl;
    if (LaserGun *gun = player.item()) {
        gun->recharge();
        gun->recharge();
        gun->recharge();
    }

    std::cout << "\n=== Holster and Drop ===" << std::endl;
    player.stopRunning();
    if (LaserGun *gun = player.item()) {
        gun->holster();
        std::cout << "Weapon state: " << gun->state() << std::endl;
    }
    player.dropItem();

    std::cout << "\n=== Final State ===" << std::endl;
    std::cout << "Player state: " << player.state() << std::endl;
    std::cout << "Player position: " << player.x() << std::endl;
    std::cout << "Has item: " << std::boolalpha << player.hasItem() << std::endl;
    return 0;
}
