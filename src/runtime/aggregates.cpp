#include <oryx/runtime/aggregates.hpp>

#include <oryx/core/compare.hpp>
#include <oryx/core/hash.hpp>
#include <oryx/runtime/eval.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace oryx::runtime {

namespace {

class CountStarAccumulator final : public Accumulator {
   public:
    void init() override { count_ = 0; }
    auto accumulate(const Value& /*value*/) -> Result<void> override {
        ++count_;
        return {};
    }
    auto finalize() const -> Result<Value> override { return Value::int64(count_); }

   private:
    std::int64_t count_ = 0;
};

class CountAccumulator final : public Accumulator {
   public:
    void init() override { count_ = 0; }
    auto accumulate(const Value& value) -> Result<void> override {
        if (!value.is_null()) {
            ++count_;
        }
        return {};
    }
    auto finalize() const -> Result<Value> override { return Value::int64(count_); }

   private:
    std::int64_t count_ = 0;
};

/// SUM keeps the widest kind seen so far and checks INT64 / NUMERIC overflow
/// through the shared arithmetic.
class SumAccumulator final : public Accumulator {
   public:
    void init() override { sum_ = Value::null(); }
    auto accumulate(const Value& value) -> Result<void> override {
        if (value.is_null()) {
            return {};
        }
        if (!is_numeric_kind(value.kind())) {
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("SUM is not defined for {}", type_name(value.kind())));
        }
        if (sum_.is_null()) {
            sum_ = value;
            return {};
        }
        auto next = arithmetic(ir::ArithmeticOp::Add, sum_, value);
        if (!next) {
            return std::unexpected(next.error());
        }
        sum_ = std::move(*next);
        return {};
    }
    auto finalize() const -> Result<Value> override { return sum_; }

   private:
    Value sum_;
};

class AvgAccumulator final : public Accumulator {
   public:
    void init() override {
        total_ = 0.0L;
        count_ = 0;
    }
    auto accumulate(const Value& value) -> Result<void> override {
        if (value.is_null()) {
            return {};
        }
        if (!is_numeric_kind(value.kind())) {
            return make_error(ErrorKind::TypeMismatch,
                              fmt::format("AVG is not defined for {}", type_name(value.kind())));
        }
        total_ += numeric_as_long_double(value);
        ++count_;
        return {};
    }
    auto finalize() const -> Result<Value> override {
        if (count_ == 0) {
            return Value::null();
        }
        return Value::float64(static_cast<double>(total_ / static_cast<long double>(count_)));
    }

   private:
    long double total_ = 0.0L;
    std::int64_t count_ = 0;
};

class ExtremumAccumulator final : public Accumulator {
   public:
    ExtremumAccumulator(bool want_max, CollationContext ctx)
        : want_max_(want_max), ctx_(std::move(ctx)) {}

    void init() override { best_ = Value::null(); }
    auto accumulate(const Value& value) -> Result<void> override {
        if (value.is_null()) {
            return {};
        }
        if (best_.is_null()) {
            best_ = value;
            return {};
        }
        auto order = order_compare(value, best_, ctx_);
        if (!order) {
            return std::unexpected(order.error());
        }
        if (want_max_ ? *order > 0 : *order < 0) {
            best_ = value;
        }
        return {};
    }
    auto finalize() const -> Result<Value> override { return best_; }

   private:
    bool want_max_;
    CollationContext ctx_;
    Value best_;
};

/// ANY_VALUE keeps the first non-NULL value, LAST the most recent one.
class PickAccumulator final : public Accumulator {
   public:
    explicit PickAccumulator(bool keep_last) : keep_last_(keep_last) {}

    void init() override { picked_ = Value::null(); }
    auto accumulate(const Value& value) -> Result<void> override {
        if (!value.is_null() && (keep_last_ || picked_.is_null())) {
            picked_ = value;
        }
        return {};
    }
    auto finalize() const -> Result<Value> override { return picked_; }

   private:
    bool keep_last_;
    Value picked_;
};

class ArrayAggAccumulator final : public Accumulator {
   public:
    void init() override { values_.clear(); }
    auto accumulate(const Value& value) -> Result<void> override {
        if (!value.is_null()) {
            values_.push_back(value);
        }
        return {};
    }
    auto finalize() const -> Result<Value> override {
        if (values_.empty()) {
            return Value::null();
        }
        return Value::array(values_);
    }

   private:
    std::vector<Value> values_;
};

/// Feeds the wrapped accumulator each distinct argument value once, in first
/// occurrence order. NULLs are passed through so the inner rule applies.
class DistinctAccumulator final : public Accumulator {
   public:
    DistinctAccumulator(std::unique_ptr<Accumulator> inner, CollationContext ctx)
        : inner_(std::move(inner)), ctx_(std::move(ctx)) {}

    void init() override {
        seen_.clear();
        inner_->init();
    }
    auto accumulate(const Value& value) -> Result<void> override {
        if (value.is_null()) {
            return inner_->accumulate(value);
        }
        auto canonical = canonical_value(value, CollationSpec{}, ctx_);
        if (!canonical) {
            return std::unexpected(canonical.error());
        }
        RowKey key{{std::move(*canonical)}};
        if (!seen_.insert(std::move(key)).second) {
            return {};
        }
        return inner_->accumulate(value);
    }
    auto finalize() const -> Result<Value> override { return inner_->finalize(); }

   private:
    std::unique_ptr<Accumulator> inner_;
    CollationContext ctx_;
    RowKeySet seen_;
};

}  // namespace

auto aggregate_name(const ir::AggSpec& spec) -> std::string_view {
    switch (spec.func) {
        case ir::AggFunc::CountStar:
        case ir::AggFunc::Count:
            return "count";
        case ir::AggFunc::Sum:
            return "sum";
        case ir::AggFunc::Avg:
            return "avg";
        case ir::AggFunc::Min:
            return "min";
        case ir::AggFunc::Max:
            return "max";
        case ir::AggFunc::AnyValue:
            return "any_value";
        case ir::AggFunc::Last:
            return "last";
        case ir::AggFunc::ArrayAgg:
            return "array_agg";
        case ir::AggFunc::Extern:
            return spec.callee;
    }
    return "aggregate";
}

auto make_accumulator(const ir::AggSpec& spec, const FunctionRegistry& functions,
                      const CollationContext& ctx) -> Result<std::unique_ptr<Accumulator>> {
    std::unique_ptr<Accumulator> acc;
    switch (spec.func) {
        case ir::AggFunc::CountStar:
            acc = std::make_unique<CountStarAccumulator>();
            break;
        case ir::AggFunc::Count:
            acc = std::make_unique<CountAccumulator>();
            break;
        case ir::AggFunc::Sum:
            acc = std::make_unique<SumAccumulator>();
            break;
        case ir::AggFunc::Avg:
            acc = std::make_unique<AvgAccumulator>();
            break;
        case ir::AggFunc::Min:
            acc = std::make_unique<ExtremumAccumulator>(false, ctx);
            break;
        case ir::AggFunc::Max:
            acc = std::make_unique<ExtremumAccumulator>(true, ctx);
            break;
        case ir::AggFunc::AnyValue:
            acc = std::make_unique<PickAccumulator>(false);
            break;
        case ir::AggFunc::Last:
            acc = std::make_unique<PickAccumulator>(true);
            break;
        case ir::AggFunc::ArrayAgg:
            acc = std::make_unique<ArrayAggAccumulator>();
            break;
        case ir::AggFunc::Extern: {
            const auto* factory = functions.find_aggregate(spec.callee);
            if (factory == nullptr) {
                return make_error(ErrorKind::InvalidPlan,
                                  fmt::format("unknown aggregate: {} (available: {})", spec.callee,
                                              functions.describe()));
            }
            acc = (*factory)();
            if (acc == nullptr) {
                return make_error(ErrorKind::InvalidPlan,
                                  fmt::format("aggregate factory for {} returned null",
                                              spec.callee));
            }
            break;
        }
    }
    if (spec.distinct && spec.func != ir::AggFunc::CountStar) {
        acc = std::make_unique<DistinctAccumulator>(std::move(acc), ctx);
    }
    acc->init();
    return acc;
}

}  // namespace oryx::runtime
