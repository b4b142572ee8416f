#pragma once

#include "sprig/aot/registration_initializer.hpp"

// Defined by the generated sprig_generated/initializer_catalog.cpp of the
// program that links it.
namespace sprig_generated {

void register_initializers(sprig::aot::InitializerCatalog& catalog);

}  // namespace sprig_generated
