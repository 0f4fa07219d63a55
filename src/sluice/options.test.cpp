#include "./options.hpp"

#include <sluice/error.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>

TEST_CASE("Default pipe options") {
    sluice::pipe_options opts;
    CHECK(opts.buffer_size == 10);
    CHECK(opts.effective_buffer_size() == 10);

    opts.buffer_size = 0;
    CHECK(opts.effective_buffer_size() == sluice::pipe_options::default_buffer_size);

    opts = {.buffer_size = 1};
    CHECK(opts.effective_buffer_size() == 1);
}

TEST_CASE("Load pipe options from the environment") {
    ::unsetenv(sluice::pipe_options::buffer_size_env);
    CHECK(sluice::pipe_options::from_environment().buffer_size == 10);

    ::setenv(sluice::pipe_options::buffer_size_env, "3", 1);
    CHECK(sluice::pipe_options::from_environment().buffer_size == 3);

    ::setenv(sluice::pipe_options::buffer_size_env, "three", 1);
    CHECK_THROWS_AS(sluice::pipe_options::from_environment(), sluice::config_error);

    ::unsetenv(sluice::pipe_options::buffer_size_env);
}
