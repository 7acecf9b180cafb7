#include <quaternet/quaternet.hpp>
#include <cassert>
#include <iostream>
#include <cmath>

using namespace quaternet;

void test_mask() {
    std::cout << "Testing Dropout Mask..." << std::endl;
    Random rng(3);
    Tensor<float> keep_all = create_dropout_mask(0.0f, {4, 5}, rng);
    assert(keep_all.sum() == 20);

    Tensor<float> mask = create_dropout_mask(0.5f, {200, 10}, rng);
    float kept = mask.sum();
    for (size_t n = 0; n < mask.size(); ++n) assert(mask[n] == 0 || mask[n] == 1);
    assert(kept > 800 && kept < 1200);

    bool threw = false;
    try {
        create_dropout_mask(0.5f, {2, 2}, rng, "conv");
    } catch (const InvalidOperationArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASS" << std::endl;
}

void test_quaternion_mask() {
    std::cout << "Testing Quaternion Mask Shares One Entry per Quaternion..." << std::endl;
    Tensor<float> x({1, 8}, {1, 2, 3, 4, 5, 6, 7, 8});
    Tensor<float> mask({1, 2}, {0, 1});

    Tensor<float> q = apply_quaternion_mask(x, mask, "quaternion");
    Tensor<float> expected({1, 8}, {0, 2, 0, 4, 0, 6, 0, 8});
    assert(q.allclose(expected, 0.0f));

    Tensor<float> full({1, 8}, {1, 0, 1, 0, 1, 0, 1, 0});
    Tensor<float> r = apply_quaternion_mask(x, full, "regular");
    assert(r[0] == 1 && r[1] == 0 && r[6] == 7);

    bool threw = false;
    try {
        apply_quaternion_mask(x, mask, "complex");
    } catch (const InvalidOperationArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASS" << std::endl;
}

void test_dropout() {
    std::cout << "Testing Quaternion Dropout..." << std::endl;
    Random rng(17);
    Tensor<float> x({64, 16});
    x.fill(1.0f);

    Tensor<float> y = apply_quaternion_dropout(x, 0.25f, rng);
    assert(y.shape() == x.shape());
    for (size_t b = 0; b < 64; ++b) {
        for (size_t h = 0; h < 4; ++h) {
            float v = y.at(b, h);
            assert(v == 0.0f || std::abs(v - 1.0f / 0.75f) < 1e-6f);
            // r, i, j and k of one quaternion are dropped together
            for (size_t c = 1; c < 4; ++c) assert(y.at(b, c * 4 + h) == v);
        }
    }

    // Seeded masks are reproducible
    Random a(5), b(5);
    assert(apply_quaternion_dropout(x, 0.5f, a).allclose(apply_quaternion_dropout(x, 0.5f, b), 0.0f));

    Tensor<float> same = apply_quaternion_dropout(x, 0.5f, rng, false);
    assert(same.allclose(x, 0.0f));

    Tensor<float> reg = apply_quaternion_dropout(x, 0.5f, rng, true, "regular");
    assert(reg.shape() == x.shape());

    bool threw = false;
    try {
        apply_quaternion_dropout(x, 0.5f, rng, true, "spatial");
    } catch (const InvalidOperationArgument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        apply_quaternion_dropout(x, 1.0f, rng);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        apply_quaternion_dropout(x, std::nanf(""), rng);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        rng.binomial(1, std::nan(""), 4);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        apply_quaternion_dropout(Tensor<float>({2, 6}), 0.5f, rng);
    } catch (const ShapeError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASS" << std::endl;
}

int main() {
    test_mask();
    test_quaternion_mask();
    test_dropout();
    std::cout << "All Dropout tests passed!" << std::endl;
    return 0;
}
