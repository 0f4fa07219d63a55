#include "./options.hpp"

#include "./environ.hpp"

using namespace sluice;

pipe_options pipe_options::from_environment() {
    pipe_options ret;
    if (auto size = getenv_size(buffer_size_env)) {
        ret.buffer_size = *size;
    }
    return ret;
}
