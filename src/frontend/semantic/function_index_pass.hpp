#pragma once

#include "semantic_pass.hpp"

namespace modsync::frontend::semantic
{

class FunctionIndexPass : public Pass
{
public:
    std::string name() const override
    {
        return "function-index";
    }

    void run(Context& context) override;
};

}  // namespace modsync::frontend::semantic
