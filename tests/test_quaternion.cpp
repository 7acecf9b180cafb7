#include <quaternet/quaternet.hpp>
#include <cassert>
#include <iostream>
#include <cmath>

using namespace quaternet;

// [2, 8]: row 0 = 1..8, row 1 = 9..16
Tensor<double> make_input() {
    Tensor<double> t({2, 8});
    for (size_t n = 0; n < t.size(); ++n) t[n] = static_cast<double>(n + 1);
    return t;
}

template <typename Fn>
bool throws_shape_error(Fn fn) {
    try {
        fn();
    } catch (const ShapeError&) {
        return true;
    }
    return false;
}

void test_check_input() {
    std::cout << "Testing check_input..." << std::endl;
    assert(throws_shape_error([] { check_input(Tensor<double>({8})); }));
    assert(throws_shape_error([] { check_input(Tensor<double>({2, 6})); }));
    assert(throws_shape_error([] { check_input(Tensor<double>({2, 2, 2, 8})); }));
    assert(throws_shape_error([] { get_r(Tensor<double>({3, 7})); }));
    assert(!throws_shape_error([] { check_input(Tensor<double>({2, 8})); }));
    assert(!throws_shape_error([] { check_input(Tensor<double>({5, 7, 8})); }));
    std::cout << "PASS" << std::endl;
}

void test_components() {
    std::cout << "Testing Component Extraction..." << std::endl;
    Tensor<double> t = make_input();

    Tensor<double> r = get_r(t), i = get_i(t), j = get_j(t), k = get_k(t);
    assert(r.shape()[0] == 2 && r.shape()[1] == 2);
    assert(r.at(0, 0) == 1 && r.at(0, 1) == 2 && r.at(1, 0) == 9);
    assert(i.at(0, 0) == 3 && i.at(1, 1) == 12);
    assert(j.at(0, 0) == 5 && j.at(1, 0) == 13);
    assert(k.at(0, 1) == 8 && k.at(1, 1) == 16);

    Tensor<double> rebuilt = Tensor<double>::cat({r, i, j, k}, -1);
    assert(rebuilt.allclose(t, 0.0));

    // Same partition on a sequence tensor
    Tensor<double> seq({3, 2, 12});
    for (size_t n = 0; n < seq.size(); ++n) seq[n] = static_cast<double>(n) * 0.5;
    auto parts = split_components(seq);
    assert(parts[2].shape()[2] == 3);
    assert(parts[2].at(1, 1, 0) == seq.at(1, 1, 6));
    assert(Tensor<double>::cat({parts[0], parts[1], parts[2], parts[3]}, -1).allclose(seq, 0.0));
    std::cout << "PASS" << std::endl;
}

void test_modulus() {
    std::cout << "Testing Modulus..." << std::endl;
    Tensor<double> t = make_input();

    Tensor<double> vec = get_modulus(t, true);
    assert(vec.shape()[0] == 2 && vec.shape()[1] == 2);
    assert(std::abs(vec.at(0, 0) - std::sqrt(1.0 + 9 + 25 + 49)) < 1e-12);
    assert(std::abs(vec.at(1, 1) - std::sqrt(100.0 + 144 + 196 + 256)) < 1e-12);

    // Reduced form sums the squares over the batch axis
    Tensor<double> red = get_modulus(t);
    assert(red.dim() == 1 && red.size() == 2);
    assert(std::abs(red[0] - std::sqrt(84.0 + 81 + 121 + 169 + 225)) < 1e-12);
    assert(std::abs(red[1] - std::sqrt(4.0 + 16 + 36 + 64 + 100 + 144 + 196 + 256)) < 1e-12);

    Tensor<double> seq({4, 3, 8});
    seq.fill(1.0);
    Tensor<double> seq_red = get_modulus(seq);
    assert(seq_red.shape()[0] == 3 && seq_red.shape()[1] == 2);
    assert(std::abs(seq_red[0] - 4.0) < 1e-12); // sqrt(4 batches * 4 components)
    std::cout << "PASS" << std::endl;
}

void test_normalized() {
    std::cout << "Testing Normalization..." << std::endl;
    Tensor<double> t = make_input();
    Tensor<double> n = get_normalized(t);
    assert(n.shape() == t.shape());

    Tensor<double> red = get_modulus(t);
    for (size_t b = 0; b < 2; ++b) {
        for (size_t c = 0; c < 4; ++c) {
            for (size_t h = 0; h < 2; ++h) {
                double expected = t.at(b, c * 2 + h) / (red[h] + 0.0001);
                assert(std::abs(n.at(b, c * 2 + h) - expected) < 1e-12);
            }
        }
    }

    Tensor<double> seq({2, 3, 8});
    seq.fill(2.0);
    Tensor<double> ns = get_normalized(seq, 0.0);
    // modulus over batch = sqrt(2 * 4 * 4) = sqrt(32)
    assert(std::abs(ns.at(1, 2, 7) - 2.0 / std::sqrt(32.0)) < 1e-12);
    std::cout << "PASS" << std::endl;
}

void test_check_weights() {
    std::cout << "Testing check_weights..." << std::endl;
    Tensor<double> a({2, 3}), b({2, 3}), c({3, 2});
    check_weights(a, b, a, b);

    bool threw = false;
    try {
        check_weights(a, b, c, a);
    } catch (const SizeMismatchError&) {
        threw = true;
    }
    assert(threw);

    Tensor<double> v({6});
    assert(throws_shape_error([&] { check_weights(v, v, v, v); }));
    std::cout << "PASS" << std::endl;
}

int main() {
    test_check_input();
    test_components();
    test_modulus();
    test_normalized();
    test_check_weights();
    std::cout << "All Quaternion tests passed!" << std::endl;
    return 0;
}
