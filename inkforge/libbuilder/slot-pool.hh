#pragma once
/// @file
/// @brief Numbered worker slots, handed out in FIFO order from within a KJ event loop.

#include <cassert>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/list.h>
#include <algorithm>
#include <memory>
#include <optional>
#include <set>

namespace inkforge {

class SlotPool
{
public:
    class [[nodiscard("destroying a slot releases it immediately")]] Slot
    {
        struct Release
        {
            unsigned index = 0;

            void operator()(SlotPool * pool) const
            {
                pool->unsafeRelease(index);
            }
        };

        std::unique_ptr<SlotPool, Release> parent;

    public:
        Slot() = default;
        Slot(SlotPool & parent, unsigned index, kj::Badge<SlotPool>)
            : parent(&parent, Release{index})
        {
        }

        bool valid() const
        {
            return parent != nullptr;
        }

        unsigned index() const
        {
            return parent.get_deleter().index;
        }
    };

private:
    struct Waiter
    {
        kj::PromiseFulfiller<Slot> & fulfiller;
        kj::ListLink<Waiter> link;
        kj::List<Waiter, &Waiter::link> & list;

        Waiter(kj::PromiseFulfiller<Slot> & fulfiller, kj::List<Waiter, &Waiter::link> & list)
            : fulfiller(fulfiller)
            , list(list)
        {
            list.add(*this);
        }

        ~Waiter()
        {
            if (link.isLinked()) {
                list.remove(*this);
            }
        }
    };

    const unsigned capacity_;
    unsigned peak_ = 0;
    std::set<unsigned> free_;
    kj::List<Waiter, &Waiter::link> waiters;

    Slot take()
    {
        auto index = *free_.begin();
        free_.erase(free_.begin());
        peak_ = std::max(peak_, used());
        return Slot{*this, index, {}};
    }

    void unsafeRelease(unsigned index)
    {
        free_.insert(index);
        while (!free_.empty() && !waiters.empty()) {
            auto & w = waiters.front();
            w.fulfiller.fulfill(take());
            waiters.remove(w);
        }
    }

public:
    explicit SlotPool(unsigned capacity) : capacity_(capacity)
    {
        for (unsigned i = 0; i < capacity; i++) {
            free_.insert(i);
        }
    }

    KJ_DISALLOW_COPY_AND_MOVE(SlotPool);

    ~SlotPool()
    {
        assert(waiters.empty() && "destroyed a slot pool with active waiters");
    }

    std::optional<Slot> tryAcquire()
    {
        if (!free_.empty() && waiters.empty()) {
            return take();
        } else {
            return {};
        }
    }

    /**
     * Wait for a free slot. Waiters are served in the order they called
     * `acquire`; dropping the promise gives up the place in the queue.
     */
    kj::Promise<Slot> acquire()
    {
        if (auto s = tryAcquire()) {
            return std::move(*s);
        } else {
            return kj::newAdaptedPromise<Slot, Waiter>(waiters);
        }
    }

    unsigned capacity() const
    {
        return capacity_;
    }

    unsigned used() const
    {
        return capacity_ - free_.size();
    }

    /**
     * Highest number of slots ever in use at the same time.
     */
    unsigned peak() const
    {
        return peak_;
    }

    unsigned waiting() const
    {
        return waiters.size();
    }
};
}
