// SPDX-License-Identifier: Apache-2.0
#include "server/game/world_loop.hpp"
#include "test_harness.hpp"

#include <cassert>
#include <iostream>

using reef::test::Harness;

int main()
{
    // Catch within radius: gold, count, targeted reply, fish removed.
    {
        Harness h;
        auto s = h.join();
        auto other = h.join();
        h.place(s, {100.f, 100.f});
        uint32_t gold_before = static_cast<uint32_t>(h.player(s).gold);
        uint32_t fid = h.add_fish({100.f, 215.f}, 40, 5);
        assert(h.gateway->catch_fish(s, fid));
        assert(h.player(s).gold == gold_before + 40);
        assert(h.player(s).fishes_caught == 1);
        assert(h.world->registry.find_fish(fid) == nullptr);
        auto msgs = h.drain(s);
        assert(msgs.size() == 1 && msgs[0]->has_caught());
        assert(msgs[0]->caught().fish().id() == fid);
        assert(msgs[0]->caught().fish().reward() == 40);
        assert(h.drain(other).empty());
        // Second attempt on the same fish is ignored.
        assert(!h.gateway->catch_fish(s, fid));
        assert(h.player(s).gold == gold_before + 40);

        // The next broadcast snapshot no longer carries the fish.
        reef::game::tick_once(*h.world, *h.sessions);
        auto after = h.drain(s);
        bool saw_state = false;
        for (const auto &m : after) {
            if (!m->has_state())
                continue;
            saw_state = true;
            for (int i = 0; i < m->state().fishes_size(); ++i)
                assert(m->state().fishes(i).id() != fid);
        }
        assert(saw_state);
    }
    // Radius boundary: 119 succeeds, 121 fails.
    {
        Harness h;
        auto s = h.join();
        h.place(s, {300.f, 300.f});
        uint32_t near_id = h.add_fish({300.f + 119.f, 300.f}, 10);
        uint32_t far_id = h.add_fish({300.f, 300.f + 121.f}, 10);
        assert(!h.gateway->catch_fish(s, far_id));
        assert(h.world->registry.find_fish(far_id) != nullptr);
        assert(h.drain(s).empty());
        assert(h.gateway->catch_fish(s, near_id));
        assert(h.player(s).fishes_caught == 1);
    }
    // Unknown fish and inactive session are ignored.
    {
        Harness h;
        auto s = h.join();
        assert(!h.gateway->catch_fish(s, 4242));
        auto pending = h.sessions->add_detached();
        uint32_t fid = h.add_fish({0.f, 0.f}, 10);
        assert(!h.gateway->catch_fish(pending, fid));
        assert(h.world->registry.find_fish(fid) != nullptr);
    }
    // Authenticated catch queues a progress flush.
    {
        Harness h;
        h.store->add_user("alice", "tok-a");
        auto s = h.join("tok-a");
        h.place(s, {100.f, 100.f});
        uint32_t fid = h.add_fish({100.f, 100.f}, 40);
        assert(h.gateway->catch_fish(s, fid));
        h.progress->wait_idle();
        auto stored = h.store->load_profile("alice");
        assert(stored && stored->gold == 290 && stored->fishes_caught == 1);
    }
    std::cout << "unit_gateway_catch OK" << std::endl;
    return 0;
}
