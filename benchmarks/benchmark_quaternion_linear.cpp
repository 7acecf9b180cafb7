#include <iostream>
#include <iomanip>
#include <chrono>
#include <cstdlib>
#include <vector>

#include <quaternet/quaternet.hpp>

using namespace quaternet;

// Compares a quaternion layer against a real layer of the same real width.
// The quaternion layer has 4x fewer parameters.
template <typename LayerT>
double time_step(LayerT& layer, const Tensor<float>& x, int iters) {
    Tensor<float> out = layer.forward(x);
    Tensor<float> grad(out.shape());
    grad.fill(1.0f);

    auto start = std::chrono::high_resolution_clock::now();
    for (int it = 0; it < iters; ++it) {
        layer.forward(x);
        layer.backward(grad);
    }
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count() / iters;
}

size_t count_parameters(layers::Layer<float>& layer) {
    size_t n = 0;
    for (auto* p : layer.parameters()) n += p->size();
    return n;
}

int main(int argc, char** argv) {
    int iters = argc > 1 ? std::atoi(argv[1]) : 20;
    const size_t batch = 64;
    const size_t seq = 16;

    std::cout << "Quaternion vs Real Linear (forward + backward), batch=" << batch
              << " seq=" << seq << " iters=" << iters << std::endl;
    std::cout << std::setw(8) << "width" << std::setw(14) << "quat (ms)" << std::setw(14) << "real (ms)"
              << std::setw(14) << "quat params" << std::setw(14) << "real params" << std::endl;

    for (size_t width : {64, 128, 256}) {
        Random rng(static_cast<uint32_t>(width));
        Tensor<float> x({batch, seq, width}, rng.uniform<float>(-1, 1, batch * seq * width));

        layers::QuaternionLinear<float> qlayer(width, width);
        layers::Linear<float> rlayer(width, width);

        double tq = time_step(qlayer, x, iters);
        double tr = time_step(rlayer, x, iters);

        std::cout << std::setw(8) << width << std::setw(14) << std::fixed << std::setprecision(3) << tq
                  << std::setw(14) << tr << std::setw(14) << count_parameters(qlayer)
                  << std::setw(14) << count_parameters(rlayer) << std::endl;
    }
    return 0;
}
