#include <Quarry/Quarry.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

struct Position
{
    std::uint64_t x;
    std::uint64_t y;
};

struct Velocity : Position {};

struct IUpdatable
{
    virtual ~IUpdatable() = default;
    virtual void Update() = 0;
};

struct Mover : IUpdatable
{
    std::uint64_t ticks = 0;

    void Update() override { ++ticks; }
};

struct Spinner : IUpdatable
{
    std::uint64_t angle = 0;

    void Update() override { angle += 3; }
};

static bool RegisterAll(Quarry::Registry& registry, benchmark::State& state)
{
    const bool registered = registry.RegisterComponent<Position>({.netId = 1}) &&
                            registry.RegisterComponent<Velocity>({.netId = 2}) &&
                            registry.RegisterComponent<Mover, IUpdatable>() &&
                            registry.RegisterComponent<Spinner, IUpdatable>();
    if (!registered)
    {
        state.SkipWithError("Component registration failed");
    }
    return registered;
}

static void BM_CreateEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        Quarry::Registry registry;
        for(size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(registry.CreateEntity());
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_AttachComponents(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Quarry::Registry registry;
        if (!RegisterAll(registry, state))
            break;
        std::vector<Quarry::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            entities.push_back(registry.CreateEntity());
        }
        state.ResumeTiming();

        for(Quarry::Entity entity : entities)
        {
            benchmark::DoNotOptimize(registry.AddComponent<Position>(entity, Position{1, 2}));
            benchmark::DoNotOptimize(registry.AddComponent<Velocity>(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count * 2);
}

static void BM_QueryType(benchmark::State& state)
{
    const size_t count = state.range(0);

    Quarry::Registry registry;
    if (!RegisterAll(registry, state))
        return;
    for(size_t i = 0; i < count; ++i)
    {
        Quarry::Entity entity = registry.CreateEntity();
        (void)registry.AddComponent<Position>(entity, Position{i, i});
        if (i % 2 == 0)
        {
            (void)registry.AddComponent<Velocity>(entity);
        }
    }

    for(auto _ : state)
    {
        std::uint64_t sum = 0;
        for(auto&& item : registry.EntityQuery<Position>())
        {
            sum += item.component.x;
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_QueryCapability(benchmark::State& state)
{
    const size_t count = state.range(0);

    Quarry::Registry registry;
    if (!RegisterAll(registry, state))
        return;
    for(size_t i = 0; i < count; ++i)
    {
        Quarry::Entity entity = registry.CreateEntity();
        if (i % 2 == 0)
        {
            (void)registry.AddComponent<Mover>(entity);
        }
        else
        {
            (void)registry.AddComponent<Spinner>(entity);
        }
    }

    for(auto _ : state)
    {
        for(auto&& item : registry.CapabilityQuery<IUpdatable>())
        {
            item.component.Update();
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_MarkAndCull(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Quarry::Registry registry;
        if (!RegisterAll(registry, state))
            break;
        std::vector<Quarry::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            Quarry::Entity entity = registry.CreateEntity();
            (void)registry.AddComponent<Position>(entity);
            entities.push_back(entity);
        }
        state.ResumeTiming();

        for(Quarry::Entity entity : entities)
        {
            registry.RemoveComponent<Position>(entity);
        }
        benchmark::DoNotOptimize(registry.Cull());
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_GetByNetID(benchmark::State& state)
{
    const size_t count = state.range(0);

    Quarry::Registry registry;
    if (!RegisterAll(registry, state))
        return;
    std::vector<Quarry::Entity> entities;
    entities.reserve(count);
    for(size_t i = 0; i < count; ++i)
    {
        Quarry::Entity entity = registry.CreateEntity();
        (void)registry.AddComponent<Position>(entity);
        (void)registry.AddComponent<Velocity>(entity);
        entities.push_back(entity);
    }

    for(auto _ : state)
    {
        for(Quarry::Entity entity : entities)
        {
            benchmark::DoNotOptimize(registry.GetComponentByNetID(entity, 2));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_DestroyEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for(auto _ : state)
    {
        state.PauseTiming();
        Quarry::Registry registry;
        if (!RegisterAll(registry, state))
            break;
        std::vector<Quarry::Entity> entities;
        entities.reserve(count);
        for(size_t i = 0; i < count; ++i)
        {
            Quarry::Entity entity = registry.CreateEntity();
            (void)registry.AddComponent<Position>(entity);
            (void)registry.AddComponent<Mover>(entity);
            (void)registry.Subscribe(entity, static_cast<Quarry::SubscriberID>(i % 8));
            entities.push_back(entity);
        }
        state.ResumeTiming();

        benchmark::DoNotOptimize(registry.DestroyEntities(entities));
    }

    state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK(BM_CreateEntities)->Range(1 << 10, 1 << 16);
BENCHMARK(BM_AttachComponents)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_QueryType)->Range(1 << 10, 1 << 16);
BENCHMARK(BM_QueryCapability)->Range(1 << 10, 1 << 16);
BENCHMARK(BM_MarkAndCull)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_GetByNetID)->Range(1 << 10, 1 << 14);
BENCHMARK(BM_DestroyEntities)->Range(1 << 10, 1 << 14);

BENCHMARK_MAIN();
