#ifndef CCA_PROFILER_BACKEND_HPP
#define CCA_PROFILER_BACKEND_HPP

/**
 * @file backend.hpp
 * @brief Interface to the external circuit profiler.
 *
 * The engine never compiles or executes circuits itself. A backend wraps
 * whatever produces the annotated profiler text (a compiler toolchain
 * invocation, a remote service, a fixture in tests) and hands the raw
 * output of each cost domain back to the engine.
 */

#include "cca/result.hpp"
#include "cca/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cca::profiler {

    /**
     * Raw profiler text per cost domain. An absent domain contributes zero.
     */
    struct ProfilerOutput {
        std::optional<std::string> constrained_text;
        std::optional<std::string> unconstrained_text;
        std::optional<std::string> gates_text;

        [[nodiscard]] bool empty() const noexcept {
            return !constrained_text && !unconstrained_text && !gates_text;
        }
    };

    class IProfilerBackend {
    public:
        virtual ~IProfilerBackend() = default;

        /**
         * Profiles @p source_code.
         *
         * @param source_code Program text to profile
         * @param manifest Package manifest, passed through unchanged
         * @param file_name Name the source is profiled under
         * @return The raw texts, or a ProfilerError
         */
        [[nodiscard]] virtual Result<ProfilerOutput, Error> profile(
            std::string_view source_code,
            const std::optional<std::string>& manifest,
            const std::string& file_name
        ) = 0;
    };

}  // namespace cca::profiler

#endif //CCA_PROFILER_BACKEND_HPP
