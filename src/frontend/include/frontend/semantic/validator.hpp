#pragma once

#include "frontend/diagnostic.hpp"
#include "frontend/module.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modsync::frontend::semantic
{

class Pass;

/**
 * @brief Runs the checks over the scanned sources of a module.
 *
 * Passes only report diagnostics; they never change what gets exported.
 * Passes run in the order they were added; a fresh context is built for every run.
 */
class Validator
{
public:
    /// Constructs a validator with the function index, alias conflict and work-in-progress passes.
    Validator(const ModuleSources& sources, DiagnosticSink& sink);
    ~Validator();

    template <typename PassType, typename... Args>
    void add_pass(Args&&... args)
    {
        append(std::make_unique<PassType>(std::forward<Args>(args)...));
    }

    /// @return false if no pass has this name
    bool remove_pass(std::string_view name);
    void remove_all_passes();

    std::vector<std::string> pass_names() const;

    void run();

private:
    void append(std::unique_ptr<Pass> pass);

    const ModuleSources& sources_;
    DiagnosticSink& sink_;
    std::vector<std::unique_ptr<Pass>> passes_;
};

}  // namespace modsync::frontend::semantic
