#include <algorithm>
#include <atomic>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/value.h>
#include <limits>

namespace cinder::runtime
{

namespace
{

thread_local MemoryBudget* g_active = nullptr;
std::atomic<std::uint64_t> g_next_epoch{1};

} // namespace

MemoryBudget::MemoryBudget(std::size_t limit_bytes)
    : limit_(limit_bytes), epoch_(g_next_epoch.fetch_add(1, std::memory_order_relaxed))
{
}

void MemoryBudget::reserve(std::size_t bytes)
{
    if (bytes > limit_ || used_ > limit_ - bytes)
    {
        exceeded_ = true;
        raise("MemoryError", "memory limit exceeded");
    }
    used_ += bytes;
    peak_ = std::max(peak_, used_);
}

void MemoryBudget::release(std::size_t bytes)
{
    used_ -= std::min(bytes, used_);
}

MemoryBudget* MemoryBudget::active()
{
    return g_active;
}

ScopedBudget::ScopedBudget(MemoryBudget& budget) : previous_(g_active)
{
    g_active = &budget;
}

ScopedBudget::~ScopedBudget()
{
    g_active = previous_;
}

void charge_object(Object& object, std::size_t bytes)
{
    MemoryBudget* budget = g_active;
    if (budget == nullptr)
    {
        return;
    }
    budget->reserve(bytes);
    object.budget_epoch = budget->epoch();
    object.charged_bytes = bytes;
}

void recharge_object(Object& object, std::size_t bytes)
{
    MemoryBudget* budget = g_active;
    if (budget == nullptr)
    {
        return;
    }

    // Objects that survived an earlier run are adopted by the current budget on first growth.
    if (object.budget_epoch != budget->epoch())
    {
        budget->reserve(bytes);
        object.budget_epoch = budget->epoch();
        object.charged_bytes = bytes;
        return;
    }

    if (bytes > object.charged_bytes)
    {
        budget->reserve(bytes - object.charged_bytes);
    }
    else
    {
        budget->release(object.charged_bytes - bytes);
    }
    object.charged_bytes = bytes;
}

void refund_object(Object& object) noexcept
{
    MemoryBudget* budget = g_active;
    if (budget != nullptr && object.budget_epoch == budget->epoch())
    {
        budget->release(object.charged_bytes);
    }
}

void check_allocation(std::size_t bytes)
{
    MemoryBudget* budget = g_active;
    if (budget == nullptr)
    {
        return;
    }
    if (bytes > budget->limit() || budget->used() > budget->limit() - bytes)
    {
        budget->reserve(bytes); // raises MemoryError
    }
}

void check_allocation(std::size_t count, std::size_t element_size)
{
    if (element_size != 0 && count > std::numeric_limits<std::size_t>::max() / element_size)
    {
        check_allocation(std::numeric_limits<std::size_t>::max());
        return;
    }
    check_allocation(count * element_size);
}

} // namespace cinder::runtime
