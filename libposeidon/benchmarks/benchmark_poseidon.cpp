#include <vector>
#include <benchmark/benchmark.h>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/algebra/utils.hpp"
#include "libposeidon/hashing/bn254_params.hpp"
#include "libposeidon/hashing/bn254_poseidon.hpp"
#include "libposeidon/hashing/poseidon.hpp"

namespace libposeidon {

static void BM_poseidon_hash_two(benchmark::State &state)
{
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const std::vector<FieldT> inputs = random_vector<FieldT>(2);
    /* keep parameter loading out of the measurement */
    const poseidon_hash<FieldT> &hasher = bn254_poseidon();

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(hasher.hash_two(inputs[0], inputs[1]));
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_poseidon_hash_two)->Unit(benchmark::kMicrosecond);

static void BM_poseidon_hash_three(benchmark::State &state)
{
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const std::vector<FieldT> inputs = random_vector<FieldT>(3);
    const poseidon_hash<FieldT> &hasher = bn254_poseidon();

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(hasher.hash_three(inputs[0], inputs[1], inputs[2]));
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_poseidon_hash_three)->Unit(benchmark::kMicrosecond);

static void BM_poseidon_hash_chain(benchmark::State &state)
{
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const size_t sz = state.range(0);
    const std::vector<FieldT> inputs = random_vector<FieldT>(sz);
    const poseidon_hash<FieldT> &hasher = bn254_poseidon();

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(hasher.hash_chain(inputs));
    }

    state.SetItemsProcessed(state.iterations() * sz);
}

BENCHMARK(BM_poseidon_hash_chain)->RangeMultiplier(4)->Range(1, 64)->Unit(benchmark::kMicrosecond);

static void BM_poseidon_permutation(benchmark::State &state)
{
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const size_t state_size = state.range(0);
    const poseidon_permutation<FieldT> permutation(bn254_poseidon_params(state_size));
    const std::vector<FieldT> input = random_vector<FieldT>(state_size);

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(permutation.permute(input));
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_poseidon_permutation)->DenseRange(3, 4)->Unit(benchmark::kMicrosecond);

static void BM_poseidon_permutation_unoptimized(benchmark::State &state)
{
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const size_t state_size = state.range(0);
    const poseidon_permutation<FieldT> permutation(bn254_poseidon_params(state_size));
    const std::vector<FieldT> input = random_vector<FieldT>(state_size);

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(permutation.permute_unoptimized(input));
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_poseidon_permutation_unoptimized)->DenseRange(3, 4)->Unit(benchmark::kMicrosecond);

}

BENCHMARK_MAIN();
