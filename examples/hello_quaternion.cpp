#include <quaternet/quaternet.hpp>
#include <iostream>
#include <vector>

using namespace quaternet;

int main() {
    std::cout << "--- quaternet Hello Quaternion ---" << std::endl;

    // 1. A batch of two rows, each holding two quaternions laid out [r r | i i | j j | k k]
    std::vector<size_t> shape = {2, 8};
    std::vector<float> data = {1, 0, 0, 1, 0, 0, 0, 0,
                               0, 1, 1, 0, 0, 0, 0, 1};
    Tensor<float> x(shape, data);
    std::cout << "Input: " << x << std::endl;
    std::cout << "Modulus (per element): " << get_modulus(x, true) << std::endl;

    // 2. Hamilton product with itself
    std::cout << "x * x: " << hamilton_product(x, x) << std::endl;

    // 3. Quaternion layer 2 -> 3 quaternions
    layers::QuaternionLinear<float> layer(8, 12, true, "glorot", "quaternion", 42);
    std::cout << "Layer: " << layer.name() << " (" << layer.in_features() << " -> "
              << layer.out_features() << ")" << std::endl;

    autograd::Context<float> ctx;
    Tensor<float> out = layer.forward(x, ctx);
    std::cout << "Output: " << out << std::endl;

    // 4. Backward of sum(out)
    Tensor<float> ones(out.shape());
    ones.fill(1.0f);
    Tensor<float> grad_input = layer.backward(ctx, ones);
    std::cout << "Grad input: " << grad_input << std::endl;
    std::cout << "Grad r_weight: " << *layer.gradients()[0] << std::endl;

    std::cout << "--- Done ---" << std::endl;
    return 0;
}
