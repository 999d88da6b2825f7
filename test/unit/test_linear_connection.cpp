#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <vector>

#include <spikeflow/connection.hpp>
#include <spikeflow/sfexcept.hpp>
#include <spikeflow/tensor.hpp>

#include "common.hpp"

using namespace spf;

TEST(linear_connection, single_output) {
    auto w = std::make_shared<weight_matrix>(shape_type{1, 2}, std::vector<double>{1.0, -1.0});
    auto con = linear_connection(2, 1, w);

    EXPECT_EQ(2u, con.in_num());
    EXPECT_EQ(1u, con.out_num());
    EXPECT_FALSE(con.stateful());

    auto y = con.forward(current_tensor({1, 2}, {3.0, 1.0}));
    EXPECT_EQ((shape_type{1, 1}), y.shape());
    EXPECT_EQ(2.0, y[0]);
}

TEST(linear_connection, weighted_sum) {
    const size_type in_num = 3, out_num = 2, batch = 4;
    auto w = std::make_shared<weight_matrix>(shape_type{out_num, in_num},
        std::vector<double>{0.5, -1.0, 2.0,
                            1.5,  0.0, -0.25});

    current_tensor x({batch, in_num});
    for (size_type i = 0; i<x.size(); ++i) x[i] = 0.25*i - 1.0;

    auto con = linear_connection(in_num, out_num, w);
    auto y = con.forward(x);
    ASSERT_EQ((shape_type{batch, out_num}), y.shape());

    for (size_type b = 0; b<batch; ++b) {
        for (size_type o = 0; o<out_num; ++o) {
            double expected = 0;
            for (size_type i = 0; i<in_num; ++i) {
                expected += x[b*in_num+i]*(*w)[o*in_num+i];
            }
            EXPECT_EQ(expected, y[b*out_num+o]) << "batch " << b << " output " << o;
        }
    }
}

TEST(linear_connection, leading_dimensions) {
    auto w = std::make_shared<weight_matrix>(shape_type{3, 2}, std::vector<double>{1, 0, 0, 1, 1, 1});
    auto con = linear_connection(2, 3, w);

    current_tensor x({2, 2, 2}, {1, 2, 3, 4, 5, 6, 7, 8});
    auto y = con.forward(x);

    EXPECT_EQ((shape_type{2, 2, 3}), y.shape());
    EXPECT_TRUE(testing::seq_eq(y, std::vector<double>{1, 2, 3, 3, 4, 7, 5, 6, 11, 7, 8, 15}));

    // Unbatched input is a single row.
    auto v = con.forward(current_tensor({2}, {2, -1}));
    EXPECT_EQ(shape_type{3}, v.shape());
    EXPECT_TRUE(testing::seq_eq(v, std::vector<double>{2, -1, 1}));
}

TEST(linear_connection, bad_input_extent) {
    auto con = linear_connection(10, 4);
    auto x = current_tensor({2, 8});

    EXPECT_THROW(con.forward(x), shape_mismatch_error);
    try {
        con.forward(x);
        FAIL() << "expected bad_input_extent";
    }
    catch (bad_input_extent& e) {
        EXPECT_EQ((shape_type{2, 8}), e.input_shape);
        EXPECT_EQ(10u, e.expected_extent);
    }
    EXPECT_THROW(con.forward(current_tensor(shape_type{})), bad_input_extent);

    // The connection is still usable afterwards.
    EXPECT_EQ((shape_type{2, 4}), con.forward(current_tensor({2, 10})).shape());
}

TEST(linear_connection, bad_configuration) {
    auto w = std::make_shared<weight_matrix>(shape_type{2, 3});

    EXPECT_THROW(linear_connection(2, 3, w), bad_weight_shape);
    EXPECT_THROW(linear_connection(3, 3, w), configuration_error);
    EXPECT_THROW(linear_connection(3, 2, shared_weights{}), bad_weight_shape);
    EXPECT_THROW(linear_connection(0, 2), bad_connection_size);
    EXPECT_THROW(linear_connection(2, 0), bad_connection_size);
    EXPECT_NO_THROW(linear_connection(3, 2, w));

    try {
        linear_connection(4, 2, w);
        FAIL() << "expected bad_weight_shape";
    }
    catch (bad_weight_shape& e) {
        EXPECT_EQ((shape_type{2, 3}), e.weight_shape);
        EXPECT_EQ(4u, e.in_num);
        EXPECT_EQ(2u, e.out_num);
    }
}

TEST(linear_connection, weights_updated_between_calls) {
    auto w = std::make_shared<weight_matrix>(shape_type{1, 2}, std::vector<double>{1.0, 1.0});
    auto con = linear_connection(2, 1, w);
    current_tensor x({1, 2}, {2.0, 3.0});

    EXPECT_EQ(5.0, con.forward(x)[0]);

    (*w)[1] = -1.0;
    EXPECT_EQ(-1.0, con.forward(x)[0]);

    *w = weight_matrix({1, 2}, {0.5, 0.5});
    EXPECT_EQ(2.5, con.forward(x)[0]);

    // The connection never writes to its weights.
    EXPECT_TRUE(testing::seq_eq(*w, std::vector<double>{0.5, 0.5}));

    // Reshaping the shared matrix invalidates the connection.
    *w = weight_matrix({2, 1}, {1.0, 1.0});
    EXPECT_THROW(con.forward(x), bad_weight_shape);
}

TEST(linear_connection, uniform_weights) {
    const size_type in_num = 16, out_num = 5;
    auto w = uniform_weights(in_num, out_num, 42);

    EXPECT_EQ((shape_type{out_num, in_num}), w->shape());
    const double bound = 1/std::sqrt(double(in_num));
    for (auto v: *w) {
        EXPECT_GE(v, -bound);
        EXPECT_LT(v, bound);
    }

    EXPECT_EQ(*w, *uniform_weights(in_num, out_num, 42));
    EXPECT_NE(*w, *uniform_weights(in_num, out_num, 43));
    EXPECT_THROW(uniform_weights(0, 1), bad_connection_size);
}

TEST(linear_connection, seeded_initialisation) {
    auto a = linear_connection(4, 3, 7);
    auto b = linear_connection(4, 3, uniform_weights(4, 3, 7));

    current_tensor x({2, 4}, {1, 2, 3, 4, -1, 0.5, 0, 2});
    EXPECT_EQ(a.forward(x), b.forward(x));
}
