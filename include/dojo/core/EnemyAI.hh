#pragma once

#include <memory>
#include <string>

#include <behaviortree_cpp/bt_factory.h>

#include "dojo/core/Fighter.hh"
#include "dojo/utils/Random.hh"

namespace dojo {

struct AIConfig {
    float desiredDistance = 64.0f;
    float margin = 10.0f;
    // Snap guard to an incoming attack inside this distance.
    float guardReactDistance = 90.0f;
    // Per-tick chance of an idle stance change, and of that change mirroring the player.
    float stanceShuffleChance = 0.01f;
    float mirrorChance = 0.6f;

    float strikeRange = 86.0f;
    float kickChance = 0.45f;
    // Chance of aiming away from the player's current guard.
    float feintChance = 0.55f;

    float initialTimerMinMs = 400.0f;
    float initialTimerMaxMs = 900.0f;
    float retryTimerMinMs = 700.0f;
    float retryTimerMaxMs = 1400.0f;
};

// Per-enemy state shared by the tree's action nodes through the blackboard
// entry "brain". Rebuilt inputs (self, dtMs, intent) are refreshed every tick.
struct BrainContext {
    const AIConfig* config = nullptr;
    Random* rng = nullptr;
    const Fighter* player = nullptr;

    const Fighter* self = nullptr;
    float dtMs = 0.0f;
    FighterIntent intent;

    float attackTimerMs = 0.0f;
    bool timerArmed = false;

    float distance() const;
    int towardPlayer() const;
};

// BT action nodes: read the brain context, write into its intent, return SUCCESS

class FacePlayer : public BT::SyncActionNode {
  public:
    FacePlayer(const std::string& name, const BT::NodeConfig& config);
    static BT::PortsList providedPorts();
    BT::NodeStatus tick() override;
};

class KeepSpacing : public BT::SyncActionNode {
  public:
    KeepSpacing(const std::string& name, const BT::NodeConfig& config);
    static BT::PortsList providedPorts();
    BT::NodeStatus tick() override;
};

class GuardStance : public BT::SyncActionNode {
  public:
    GuardStance(const std::string& name, const BT::NodeConfig& config);
    static BT::PortsList providedPorts();
    BT::NodeStatus tick() override;
};

class StrikeWhenReady : public BT::SyncActionNode {
  public:
    StrikeWhenReady(const std::string& name, const BT::NodeConfig& config);
    static BT::PortsList providedPorts();
    BT::NodeStatus tick() override;
};

// One enemy's decision process: a behavior tree plus its context.
class EnemyBrain : public FighterController {
  public:
    EnemyBrain(BT::Tree tree, std::unique_ptr<BrainContext> context);

    void setPlayer(const Fighter* player);

    FighterIntent decide(const Fighter& self, float dtMs) override;

    const BrainContext& context() const;

  private:
    BT::Tree tree_;
    std::unique_ptr<BrainContext> context_;
};

// Wraps the BehaviorTree.CPP factory with the enemy node set registered and
// hands out one brain per enemy. All brains draw from the same seeded RNG.
class EnemyAI {
  public:
    explicit EnemyAI(Random& rng, const AIConfig& config = AIConfig());

    BT::BehaviorTreeFactory& factory();
    const AIConfig& config() const;

    std::unique_ptr<EnemyBrain> createBrain(const std::string& treeXml = defaultTreeXml());

    static const std::string& defaultTreeXml();

  private:
    BT::BehaviorTreeFactory factory_;
    Random& rng_;
    AIConfig config_;
};

} // namespace dojo
