// World model: snapshots, deltas, smoothing, projectiles, spawn animations and match queries.
#include <cassert>
#include <cmath>
#include <string>

#include "../game/world/WorldModel.h"

using namespace Rumble;

namespace {

bool near(float a, float b, float eps = 1e-3f) { return std::fabs(a - b) <= eps; }

Net::UnitState makeUnit(int64_t id, int64_t owner, double x, double y, const std::string& cls = "melee",
                        int range = 0, int hp = 100) {
    Net::UnitState u;
    u.id = id;
    u.name = "Unit" + std::to_string(id);
    u.ownerId = owner;
    u.x = x;
    u.y = y;
    u.unitClass = cls;
    u.range = range;
    u.hp = hp;
    u.maxHp = 100;
    return u;
}

Net::BaseState makeBase(int64_t owner, int y, int hp = 1000, int maxHp = 1000) {
    Net::BaseState b;
    b.ownerId = owner;
    b.x = 250;
    b.y = y;
    b.w = 100;
    b.h = 60;
    b.hp = hp;
    b.maxHp = maxHp;
    return b;
}

}  // namespace

int main() {
    {
        WorldModel world;
        assert(world.empty());
        Net::FullSnapshotMsg snap;
        snap.units.push_back(makeUnit(1, 7, 10.0, 20.0));
        snap.bases.push_back(makeBase(7, 850));
        world.applySnapshot(snap);
        const RenderUnit* u = world.unit(1);
        assert(u);
        assert(u->renderPos.x == 10.0f && u->renderPos.y == 20.0f);
        assert(world.base(7) && world.base(7)->hp == 1000);

        // Half the remaining distance per 0.05 s step, then an exact snap.
        Net::StateDeltaMsg delta;
        delta.unitsUpsert.push_back(makeUnit(1, 7, 110.0, 20.0));
        world.applyDelta(delta);
        assert(world.unit(1)->serverPos.x == 110.0f);
        assert(world.unit(1)->renderPos.x == 10.0f);
        world.step(0.05f);
        assert(near(world.unit(1)->renderPos.x, 60.0f));
        for (int i = 0; i < 40; ++i) world.step(0.05f);
        assert(world.unit(1)->renderPos.x == 110.0f);

        // Large steps clamp to the target instead of overshooting.
        delta.unitsUpsert[0].x = 0.0;
        world.applyDelta(delta);
        world.step(1.0f);
        assert(world.unit(1)->renderPos.x == 0.0f);

        // New units appear in place; removals drop them.
        Net::StateDeltaMsg second;
        second.unitsUpsert.push_back(makeUnit(2, 8, 300.0, 300.0));
        second.unitsRemoved.push_back(1);
        world.applyDelta(second);
        assert(!world.unit(1));
        assert(world.unit(2)->renderPos.x == 300.0f);

        // Snapshots replace everything.
        world.applySnapshot(Net::FullSnapshotMsg{});
        assert(world.units().empty() && world.bases().empty());
    }
    {
        WorldModel world;
        Net::StateDeltaMsg delta;
        Net::ProjectileState p;
        p.id = 5;
        p.x = 0.0;
        p.y = 0.0;
        p.tx = 100.0;
        p.ty = 0.0;
        p.active = true;
        delta.projectiles.push_back(p);
        Net::ProjectileState spent = p;
        spent.id = 6;
        spent.active = false;
        delta.projectiles.push_back(spent);
        world.applyDelta(delta);
        assert(world.projectiles().size() == 1);
        assert(world.projectiles().at(5).type == "default");

        world.step(0.1f);
        assert(near(world.projectiles().at(5).pos.x, 40.0f));

        // A delta without projectiles leaves the current ones flying.
        world.applyDelta(Net::StateDeltaMsg{});
        assert(world.projectiles().size() == 1);

        world.step(0.1f);
        world.step(0.1f);
        assert(near(world.projectiles().at(5).pos.x, 100.0f));
        world.step(0.1f);
        assert(world.projectiles().empty());
    }
    {
        WorldModel world;
        Net::FullSnapshotMsg snap;
        snap.units.push_back(makeUnit(9, 1, 100.0, 200.0));
        world.applySnapshot(snap);

        Net::UnitSpawnEventMsg spawn;
        spawn.unitId = 9;
        spawn.unitX = 100.0;
        spawn.unitY = 200.0;
        spawn.unitName = "Knight";
        world.startSpawnAnimation(spawn);
        const SpawnAnimation* anim = world.activeSpawnAnimation(9);
        assert(anim);
        assert(anim->startPos.y == 160.0f);
        assert(anim->currentScale == 1.4f);
        assert(world.isSuppressed(9));

        // Suppressed units hold their rendered position.
        Net::StateDeltaMsg delta;
        delta.unitsUpsert.push_back(makeUnit(9, 1, 150.0, 200.0));
        world.applyDelta(delta);
        world.step(0.2f);
        assert(world.unit(9)->renderPos.x == 100.0f);
        anim = world.activeSpawnAnimation(9);
        assert(anim && near(anim->progress, 0.5f));
        // Cubic ease-out at t = 0.5 covers 87.5% of the way.
        assert(near(anim->currentScale, 1.05f));
        assert(near(anim->currentPos.y, 195.0f));

        world.step(0.2f);
        assert(!world.isSuppressed(9));
        assert(world.spawnAnimations().size() == 1);
        assert(world.spawnAnimations()[0].currentScale == 1.0f);
        world.step(0.01f);
        assert(world.spawnAnimations().empty());
        assert(world.unit(9)->renderPos.x > 100.0f);
    }
    {
        WorldModel world;
        Net::FullSnapshotMsg snap;
        snap.units.push_back(makeUnit(1, 1, 100.0, 100.0, "Range", 150));
        snap.units.push_back(makeUnit(2, 2, 100.0, 200.0));
        snap.units.push_back(makeUnit(3, 2, 100.0, 0.0));
        snap.units.push_back(makeUnit(4, 2, 100.0, 120.0, "melee", 0, 0));
        world.applySnapshot(snap);

        // Equal distance: lower id wins; dead units are never targets.
        Engine::Vec2 target = world.findTargetFor(*world.unit(1));
        assert(target.x == 100.0f && target.y == 200.0f);

        world.step(0.016f);
        assert(world.inferredShots().size() == 1);
        assert(world.inferredShots()[0].shooterId == 1);
        assert(world.inferredShots()[0].target.y == 200.0f);

        // Streamed projectiles suppress inferred shots.
        Net::StateDeltaMsg delta;
        Net::ProjectileState p;
        p.id = 1;
        p.tx = 500.0;
        p.active = true;
        delta.projectiles.push_back(p);
        world.applyDelta(delta);
        world.step(0.016f);
        assert(world.inferredShots().empty());
    }
    {
        WorldModel world;
        Net::FullSnapshotMsg snap;
        snap.units.push_back(makeUnit(1, 1, 300.0, 495.0, "range", 400));
        world.applySnapshot(snap);
        // No enemies and no bases: aim at the screen center, too close to shoot.
        Engine::Vec2 target = world.findTargetFor(*world.unit(1));
        assert(target.x == 300.0f && target.y == 500.0f);
        world.step(0.016f);
        assert(world.inferredShots().empty());

        snap.bases.push_back(makeBase(2, 100));
        snap.bases.push_back(makeBase(3, 40));
        world.applySnapshot(snap);
        target = world.findTargetFor(*world.unit(1));
        assert(target.x == 300.0f && target.y == 130.0f);
        world.step(0.016f);
        assert(world.inferredShots().size() == 1);
        assert(world.inferredShots()[0].type == "default");
    }
    {
        WorldModel world;
        Net::FullSnapshotMsg snap;
        snap.bases.push_back(makeBase(1, 100));
        snap.bases.push_back(makeBase(2, 850));
        world.applySnapshot(snap);
        assert(world.isPvpMatch(1, "pvp-42"));
        assert(!world.isPvpMatch(1, "room-42"));
        assert(!world.isPvpMatch(5, "pvp-42"));
        assert(world.shouldMirror(1, "pvp-42"));
        assert(!world.shouldMirror(2, "pvp-42"));

        assert(world.matchOutcome(1, 60) == MatchOutcome::Ongoing);
        Net::StateDeltaMsg delta;
        delta.bases.push_back(makeBase(2, 850, 0));
        world.applyDelta(delta);
        assert(world.matchOutcome(1, 60) == MatchOutcome::Victory);
        assert(world.matchOutcome(2, 60) == MatchOutcome::Defeat);

        delta.bases[0] = makeBase(2, 850, 400, 1000);
        delta.bases.push_back(makeBase(1, 100, 300, 500));
        world.applyDelta(delta);
        assert(world.matchOutcome(1, 0) == MatchOutcome::Victory);
        assert(world.matchOutcome(2, 0) == MatchOutcome::Defeat);
        delta.bases[1] = makeBase(1, 100, 200, 500);
        world.applyDelta(delta);
        assert(world.matchOutcome(1, 0) == MatchOutcome::Draw);
        assert(std::string(toString(MatchOutcome::Draw)) == "draw");
    }
    {
        assert(projectileTypeForName("Blaze Mage") == "fire");
        assert(projectileTypeForName("FROST archer") == "frost");
        assert(projectileTypeForName("Stormcaller") == "lightning");
        assert(projectileTypeForName("Archer") == "default");
    }
    return 0;
}
