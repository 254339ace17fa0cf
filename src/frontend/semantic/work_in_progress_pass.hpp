#pragma once

#include "semantic_pass.hpp"

namespace modsync::frontend::semantic
{

class WorkInProgressPass : public Pass
{
public:
    std::string name() const override
    {
        return "work-in-progress";
    }

    void run(Context& context) override;
};

}  // namespace modsync::frontend::semantic
