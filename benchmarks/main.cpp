void run_materialize_benchmarks();
void run_bind_benchmarks();

auto main() -> int {
    run_materialize_benchmarks();
    run_bind_benchmarks();
    return 0;
}
