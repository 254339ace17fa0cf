#pragma once

#include "semantic_pass.hpp"

namespace modsync::frontend::semantic
{

class AliasConflictPass : public Pass
{
public:
    std::string name() const override
    {
        return "alias-conflicts";
    }

    void run(Context& context) override;
};

}  // namespace modsync::frontend::semantic
