#ifndef QUATERNET_HPP
#define QUATERNET_HPP

// Core
#include "core/Errors.hpp"
#include "core/Random.hpp"
#include "core/Tensor.hpp"

// Quaternion algebra
#include "quaternion/Quaternion.hpp"
#include "quaternion/Hamilton.hpp"
#include "quaternion/Dropout.hpp"

// Initialization
#include "init/QuaternionInit.hpp"

// Differentiable operators
#include "autograd/Function.hpp"
#include "functional/QuaternionLinear.hpp"
#include "functional/Linear.hpp"

// Layers
#include "layers/Layer.hpp"
#include "layers/QuaternionLinear.hpp"
#include "layers/Linear.hpp"

#endif // QUATERNET_HPP
