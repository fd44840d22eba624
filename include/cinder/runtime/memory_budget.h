#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @file memory_budget.h
 * @brief Per-run accounting of script heap allocations.
 *
 * The budget active on the current thread is charged for every heap object the interpreter
 * creates and refunded when that object dies. A refused reservation raises the script-level
 * MemoryError.
 */

namespace cinder::runtime
{

struct Object;

class MemoryBudget
{
  public:
    explicit MemoryBudget(std::size_t limit_bytes);

    [[nodiscard]] std::size_t limit() const { return limit_; }
    [[nodiscard]] std::size_t used() const { return used_; }
    [[nodiscard]] std::size_t peak() const { return peak_; }
    [[nodiscard]] std::uint64_t epoch() const { return epoch_; }
    /** @brief True once any reservation has been refused. */
    [[nodiscard]] bool exceeded() const { return exceeded_; }

    /** @brief Account `bytes` more; raises MemoryError (and charges nothing) when over limit. */
    void reserve(std::size_t bytes);
    /** @brief Return `bytes` previously reserved. */
    void release(std::size_t bytes);

    /** @brief Budget active on the calling thread, or null. */
    [[nodiscard]] static MemoryBudget* active();

  private:
    friend class ScopedBudget;

    std::size_t limit_;
    std::size_t used_ = 0;
    std::size_t peak_ = 0;
    std::uint64_t epoch_;
    bool exceeded_ = false;
};

/** @brief Makes a budget active on this thread for the lifetime of the scope. */
class ScopedBudget
{
  public:
    explicit ScopedBudget(MemoryBudget& budget);
    ~ScopedBudget();

    ScopedBudget(const ScopedBudget&) = delete;
    ScopedBudget& operator=(const ScopedBudget&) = delete;

  private:
    MemoryBudget* previous_;
};

/** @brief Charge `bytes` for a newly created object to the active budget. */
void charge_object(Object& object, std::size_t bytes);

/** @brief Re-account `object` to a new total of `bytes`. */
void recharge_object(Object& object, std::size_t bytes);

/** @brief Refund an object's charge when it dies on the thread that paid for it. */
void refund_object(Object& object) noexcept;

/** @brief Fail early when an allocation of `bytes` is about to be made. */
void check_allocation(std::size_t bytes);

/** @brief Same as check_allocation for `count` elements of `element_size` bytes. */
void check_allocation(std::size_t count, std::size_t element_size);

} // namespace cinder::runtime
