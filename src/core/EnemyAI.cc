#include "dojo/core/EnemyAI.hh"

#include "dojo/core/Log.hh"
#include "dojo/utils/ErrorHandling.hh"

#include <array>
#include <cmath>

namespace dojo {

namespace {

const std::string kEnemyBrainXml = R"(
<root BTCPP_format="4" main_tree_to_execute="EnemyBrain">
    <BehaviorTree ID="EnemyBrain">
        <Sequence>
            <FacePlayer/>
            <KeepSpacing/>
            <GuardStance/>
            <StrikeWhenReady/>
        </Sequence>
    </BehaviorTree>
</root>
)";

BrainContext* brainOf(const BT::TreeNode& node) {
    auto* ctx = node.config().blackboard->get<BrainContext*>("brain");
    if (!ctx || !ctx->self || !ctx->player || !ctx->config || !ctx->rng) {
        return nullptr;
    }
    return ctx;
}

} // namespace

float BrainContext::distance() const {
    return std::abs(self->x() - player->x());
}

int BrainContext::towardPlayer() const {
    return self->x() < player->x() ? 1 : -1;
}

// Action nodes

FacePlayer::FacePlayer(const std::string& name, const BT::NodeConfig& config) : BT::SyncActionNode(name, config) {}

BT::PortsList FacePlayer::providedPorts() {
    return {};
}

BT::NodeStatus FacePlayer::tick() {
    auto* ctx = brainOf(*this);
    if (!ctx)
        return BT::NodeStatus::FAILURE;
    ctx->intent.facing = ctx->player->x() >= ctx->self->x() ? 1 : -1;
    return BT::NodeStatus::SUCCESS;
}

KeepSpacing::KeepSpacing(const std::string& name, const BT::NodeConfig& config) : BT::SyncActionNode(name, config) {}

BT::PortsList KeepSpacing::providedPorts() {
    return {};
}

BT::NodeStatus KeepSpacing::tick() {
    auto* ctx = brainOf(*this);
    if (!ctx)
        return BT::NodeStatus::FAILURE;

    const auto& cfg = *ctx->config;
    float dist = ctx->distance();
    if (ctx->self->isAttacking()) {
        ctx->intent.moveDir = 0;
    } else if (dist > cfg.desiredDistance + cfg.margin) {
        ctx->intent.moveDir = ctx->towardPlayer();
    } else if (dist < cfg.desiredDistance - cfg.margin) {
        ctx->intent.moveDir = -ctx->towardPlayer();
    } else {
        ctx->intent.moveDir = 0;
    }
    return BT::NodeStatus::SUCCESS;
}

GuardStance::GuardStance(const std::string& name, const BT::NodeConfig& config) : BT::SyncActionNode(name, config) {}

BT::PortsList GuardStance::providedPorts() {
    return {};
}

BT::NodeStatus GuardStance::tick() {
    auto* ctx = brainOf(*this);
    if (!ctx)
        return BT::NodeStatus::FAILURE;

    const auto& cfg = *ctx->config;
    const auto& incoming = ctx->player->attack();
    if (incoming && ctx->distance() < cfg.guardReactDistance) {
        ctx->intent.stance = incoming->height;
    } else if (ctx->rng->chance(cfg.stanceShuffleChance)) {
        if (ctx->rng->chance(cfg.mirrorChance))
            ctx->intent.stance = ctx->player->stance();
        else
            ctx->intent.stance = heightFromIndex(ctx->rng->index(static_cast<int>(kHeightCount)));
    }
    return BT::NodeStatus::SUCCESS;
}

StrikeWhenReady::StrikeWhenReady(const std::string& name, const BT::NodeConfig& config)
    : BT::SyncActionNode(name, config) {}

BT::PortsList StrikeWhenReady::providedPorts() {
    return {};
}

BT::NodeStatus StrikeWhenReady::tick() {
    auto* ctx = brainOf(*this);
    if (!ctx)
        return BT::NodeStatus::FAILURE;

    const auto& cfg = *ctx->config;
    if (!ctx->timerArmed) {
        ctx->attackTimerMs = ctx->rng->uniform(cfg.initialTimerMinMs, cfg.initialTimerMaxMs);
        ctx->timerArmed = true;
    }
    ctx->attackTimerMs -= ctx->dtMs;

    const Fighter& self = *ctx->self;
    if (ctx->attackTimerMs > 0.0f || self.isAttacking() || self.attackCooldownMs() > 0.0f ||
        ctx->distance() >= cfg.strikeRange) {
        return BT::NodeStatus::SUCCESS;
    }

    AttackKind kind = ctx->rng->chance(cfg.kickChance) ? AttackKind::Kick : AttackKind::Punch;
    Height aim = heightFromIndex(ctx->rng->index(static_cast<int>(kHeightCount)));
    if (ctx->rng->chance(cfg.feintChance)) {
        // Slip past the current guard
        std::array<Height, kHeightCount - 1> others{};
        size_t n = 0;
        for (auto h : kAllHeights) {
            if (h != ctx->player->stance())
                others[n++] = h;
        }
        aim = others[static_cast<size_t>(ctx->rng->index(static_cast<int>(n)))];
    }

    ctx->intent.attack = AttackRequest{kind, aim};
    ctx->attackTimerMs = ctx->rng->uniform(cfg.retryTimerMinMs, cfg.retryTimerMaxMs);
    DOJO_LOG_TRACE("{} winds up {} at {}", self.name(), attackKindToString(kind), heightToString(aim));
    return BT::NodeStatus::SUCCESS;
}

// EnemyBrain

EnemyBrain::EnemyBrain(BT::Tree tree, std::unique_ptr<BrainContext> context)
    : tree_(std::move(tree)), context_(std::move(context)) {
    if (!context_) {
        throwError("EnemyBrain requires a context");
    }
}

void EnemyBrain::setPlayer(const Fighter* player) {
    context_->player = player;
}

FighterIntent EnemyBrain::decide(const Fighter& self, float dtMs) {
    context_->self = &self;
    context_->dtMs = dtMs;
    context_->intent = FighterIntent{};

    if (!context_->player || !tree_.rootNode())
        return context_->intent;

    auto status = tree_.tickOnce();

    // Reset tree after completion so it re-evaluates next tick
    if (status == BT::NodeStatus::SUCCESS || status == BT::NodeStatus::FAILURE) {
        tree_.haltTree();
    }
    return context_->intent;
}

const BrainContext& EnemyBrain::context() const {
    return *context_;
}

// EnemyAI

EnemyAI::EnemyAI(Random& rng, const AIConfig& config) : rng_(rng), config_(config) {
    factory_.registerNodeType<FacePlayer>("FacePlayer");
    factory_.registerNodeType<KeepSpacing>("KeepSpacing");
    factory_.registerNodeType<GuardStance>("GuardStance");
    factory_.registerNodeType<StrikeWhenReady>("StrikeWhenReady");
    DOJO_LOG_DEBUG("EnemyAI initialized (4 node types registered)");
}

BT::BehaviorTreeFactory& EnemyAI::factory() {
    return factory_;
}

const AIConfig& EnemyAI::config() const {
    return config_;
}

std::unique_ptr<EnemyBrain> EnemyAI::createBrain(const std::string& treeXml) {
    auto context = std::make_unique<BrainContext>();
    context->config = &config_;
    context->rng = &rng_;

    auto blackboard = BT::Blackboard::create();
    blackboard->set("brain", context.get());

    BT::Tree tree = factory_.createTreeFromText(treeXml, blackboard);
    return std::make_unique<EnemyBrain>(std::move(tree), std::move(context));
}

const std::string& EnemyAI::defaultTreeXml() {
    return kEnemyBrainXml;
}

} // namespace dojo
