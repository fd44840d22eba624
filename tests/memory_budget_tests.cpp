#include <cinder/runtime/errors.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/value.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static bool raises_memory_error(void (*body)())
{
    try
    {
        body();
    }
    catch (const cinder::runtime::ScriptError& error)
    {
        return error.is_a("MemoryError");
    }
    return false;
}

int main()
{
    namespace rt = cinder::runtime;

    if (rt::MemoryBudget::active() != nullptr)
    {
        fail("no budget should be active by default");
    }

    // Reservations accumulate and track the peak.
    {
        rt::MemoryBudget budget(1000);
        budget.reserve(400);
        budget.reserve(500);
        budget.release(600);
        if (budget.used() != 300 || budget.peak() != 900 || budget.exceeded())
        {
            fail("unexpected used/peak after reserve and release");
        }
        budget.release(10000);
        if (budget.used() != 0)
        {
            fail("release must not underflow");
        }
    }

    // A refused reservation raises MemoryError and charges nothing.
    {
        rt::MemoryBudget budget(100);
        budget.reserve(60);
        bool raised = false;
        try
        {
            budget.reserve(50);
        }
        catch (const rt::ScriptError& error)
        {
            raised = error.is_a("MemoryError") && error.is_a("Exception");
        }
        if (!raised || budget.used() != 60 || !budget.exceeded())
        {
            fail("over-limit reservation should raise and leave usage unchanged");
        }
    }

    // Objects are charged on creation and refunded when they die.
    {
        rt::MemoryBudget budget(1 << 20);
        rt::ScopedBudget scope(budget);
        if (rt::MemoryBudget::active() != &budget)
        {
            fail("scoped budget should be active");
        }
        {
            const rt::Value s = rt::make_str(std::string(4096, 'x'));
            if (budget.used() < 4096)
            {
                fail("string payload should be charged");
            }
        }
        if (budget.used() != 0)
        {
            fail("dead objects should be refunded, still using " + std::to_string(budget.used()));
        }
    }
    if (rt::MemoryBudget::active() != nullptr)
    {
        fail("scope exit should restore the previous budget");
    }

    // Creating an object the budget cannot hold raises MemoryError.
    {
        rt::MemoryBudget budget(1024);
        rt::ScopedBudget scope(budget);
        if (!raises_memory_error([] { (void)rt::make_str(std::string(4096, 'x')); }))
        {
            fail("oversized string should raise MemoryError");
        }
        if (!raises_memory_error([] { rt::check_allocation(std::size_t{1} << 40, 16); }))
        {
            fail("check_allocation should refuse a huge request");
        }
    }

    // Objects from an earlier run are not refunded to a later budget.
    {
        rt::Value survivor;
        {
            rt::MemoryBudget first(1 << 20);
            rt::ScopedBudget scope(first);
            survivor = rt::make_list({rt::Value::integer(1), rt::Value::integer(2)});
        }
        rt::MemoryBudget second(1 << 20);
        rt::ScopedBudget scope(second);
        second.reserve(10);
        survivor = rt::Value::none();
        if (second.used() != 10)
        {
            fail("refund from an older epoch leaked into the current budget");
        }
    }

    // Without an active budget nothing is charged.
    {
        const rt::Value big = rt::make_str(std::string(1 << 16, 'y'));
        if (rt::MemoryBudget::active() != nullptr)
        {
            fail("creating objects must not activate a budget");
        }
    }

    std::cout << "OK\n";
    return 0;
}
