#pragma once

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <moebius/evol/graph.hpp>
#include <moebius/evol/initializer.hpp>
#include <moebius/params/grid_value.hpp>

namespace moebius::evol {

/// Границы [lo, hi] для одного листа дерева значений.
struct Bounds {
    double lo{0.0};
    double hi{0.0};
};

/**
 * @brief Дерево границ, повторяющее форму дерева значений поля.
 *
 * Лист Bounds, приложенный к списку значений, действует на каждый его элемент;
 * список границ прикладывается к списку значений поэлементно (длины должны
 * совпадать).
 *
 * @warning `BoundSpec{b}` строит список из одного элемента; для листа пишите `BoundSpec(b)`.
 */
struct BoundSpec {
    std::variant<Bounds, std::vector<BoundSpec>> node;

    BoundSpec(Bounds b) : node(b) {}

    BoundSpec(std::initializer_list<BoundSpec> items) : node(std::vector<BoundSpec>(items)) {}

    BoundSpec(std::vector<BoundSpec> items) : node(std::move(items)) {}

    [[nodiscard]] bool isLeaf() const noexcept { return std::holds_alternative<Bounds>(node); }
};

/// Выбор узла графа, к которому применяется мутация.
class NodeSelector {
   public:
    virtual ~NodeSelector() = default;

    [[nodiscard]] virtual GeneratorNode& select(GeneratorModel& graph, RandomEngine& rng) const = 0;
};

/// Случайный узел.
class RandomNodeSelector final : public NodeSelector {
   public:
    /// @throws std::invalid_argument если граф пуст.
    GeneratorNode& select(GeneratorModel& graph, RandomEngine& rng) const override {
        if (graph.empty()) throw std::invalid_argument("RandomNodeSelector: graph has no nodes");

        std::uniform_int_distribution<std::size_t> pick(0, graph.size() - 1);
        return graph.nodes()[pick(rng)];
    }
};

/// Узел с заданным именем.
class ByNameNodeSelector final : public NodeSelector {
   public:
    explicit ByNameNodeSelector(std::string name) : name_(std::move(name)) {}

    /// @throws std::invalid_argument если узла с таким именем нет.
    GeneratorNode& select(GeneratorModel& graph, RandomEngine&) const override {
        if (auto* node = graph.findNode(name_)) return *node;
        throw std::invalid_argument("ByNameNodeSelector: node with name \"" + name_ + "\" not found");
    }

   private:
    std::string name_;
};

/// Мутация одного узла. Изменяет только переданный узел.
class NodeMutator {
   public:
    virtual ~NodeMutator() = default;

    virtual void mutate(GeneratorNode& node, RandomEngine& rng) const = 0;
};

/**
 * @brief Мутация поля узла, управляемая деревом границ.
 *
 * Рекурсивно спускается по дереву значений поля и дереву границ
 * одновременно и применяет terminal() к каждому листу значения вместе с его
 * границами.
 */
class RangeNodeMutator : public NodeMutator {
   public:
    /// @throws std::invalid_argument если какие-то границы имеют lo > hi или не конечны.
    RangeNodeMutator(ParamField field, BoundSpec bounds) : field_(field), bounds_(std::move(bounds)) {
        validate(bounds_);
    }

    [[nodiscard]] ParamField getField() const noexcept { return field_; }

    [[nodiscard]] const BoundSpec& getBounds() const noexcept { return bounds_; }

    void mutate(GeneratorNode& node, RandomEngine& rng) const override { descend(node.field(field_), bounds_, rng); }

   protected:
    /// Новое значение листа @p value с границами @p bounds.
    [[nodiscard]] virtual double terminal(double value, const Bounds& bounds, RandomEngine& rng) const = 0;

    /// @throws std::invalid_argument при несовпадении форм дерева значений и дерева границ.
    void descend(params::GridValue& value, const BoundSpec& spec, RandomEngine& rng) const {
        if (const auto* b = std::get_if<Bounds>(&spec.node)) {
            if (value.isScalar()) {
                value = terminal(value.scalar(), *b, rng);
            } else {
                for (auto& item : value.list()) descend(item, spec, rng);
            }
            return;
        }

        const auto& items = std::get<std::vector<BoundSpec>>(spec.node);
        if (!value.isList() || value.size() != items.size()) {
            throw std::invalid_argument("RangeNodeMutator: value shape does not match bounds shape");
        }
        for (std::size_t i = 0; i < items.size(); ++i) descend(value[i], items[i], rng);
    }

    ParamField field_;
    BoundSpec bounds_;

   private:
    static void validate(const BoundSpec& spec) {
        if (const auto* b = std::get_if<Bounds>(&spec.node)) {
            if (!(b->lo <= b->hi) || !std::isfinite(b->lo) || !std::isfinite(b->hi)) {
                throw std::invalid_argument("RangeNodeMutator: bounds must be finite with lo <= hi");
            }
            return;
        }
        for (const auto& item : std::get<std::vector<BoundSpec>>(spec.node)) validate(item);
    }
};

/// Прибавить U(lo, hi) к каждому листу (листья с lo == hi не меняются).
class RandomDeltaNodeMutator final : public RangeNodeMutator {
   public:
    using RangeNodeMutator::RangeNodeMutator;

   protected:
    double terminal(double value, const Bounds& b, RandomEngine& rng) const override {
        if (b.lo == b.hi) return value;
        return value + std::uniform_real_distribution<double>(b.lo, b.hi)(rng);
    }
};

/// Заменить каждый лист на U(lo, hi) (листья с lo == hi не меняются).
class RandomValueNodeMutator final : public RangeNodeMutator {
   public:
    using RangeNodeMutator::RangeNodeMutator;

   protected:
    double terminal(double value, const Bounds& b, RandomEngine& rng) const override {
        if (b.lo == b.hi) return value;
        return std::uniform_real_distribution<double>(b.lo, b.hi)(rng);
    }
};

/**
 * @brief Прибавить U(lo, hi) к листьям одного случайного элемента верхнего уровня.
 *
 * Например, к среднему одной случайной компоненты.
 */
class RandomIndexRandomDeltaNodeMutator final : public RangeNodeMutator {
   public:
    using RangeNodeMutator::RangeNodeMutator;

    void mutate(GeneratorNode& node, RandomEngine& rng) const override {
        auto& value = node.field(field_);
        if (!value.isList() || value.size() == 0) {
            throw std::invalid_argument("RandomIndexRandomDeltaNodeMutator: field must be a non-empty list");
        }

        const std::size_t n = bounds_.isLeaf() ? value.size() : std::get<std::vector<BoundSpec>>(bounds_.node).size();
        if (n != value.size()) {
            throw std::invalid_argument("RandomIndexRandomDeltaNodeMutator: value shape does not match bounds shape");
        }

        const std::size_t idx = std::uniform_int_distribution<std::size_t>(0, n - 1)(rng);
        descend(value[idx], bounds_.isLeaf() ? bounds_ : std::get<std::vector<BoundSpec>>(bounds_.node)[idx], rng);
    }

   protected:
    double terminal(double value, const Bounds& b, RandomEngine& rng) const override {
        if (b.lo == b.hi) return value;
        return value + std::uniform_real_distribution<double>(b.lo, b.hi)(rng);
    }
};

/**
 * @brief Применить вложенную мутацию, затем вернуть вылетевшие листья в границы.
 *
 * Лист вне [lo, hi] заменяется на U(lo, hi).
 */
class ClampNodeDecoratedMutator final : public RangeNodeMutator {
   public:
    /// @throws std::invalid_argument если decorated пуст.
    ClampNodeDecoratedMutator(ParamField field, std::shared_ptr<const NodeMutator> decorated, BoundSpec bounds)
        : RangeNodeMutator(field, std::move(bounds)), decorated_(std::move(decorated)) {
        if (!decorated_) throw std::invalid_argument("ClampNodeDecoratedMutator: decorated mutator must be set");
    }

    void mutate(GeneratorNode& node, RandomEngine& rng) const override {
        decorated_->mutate(node, rng);
        RangeNodeMutator::mutate(node, rng);
    }

   protected:
    double terminal(double value, const Bounds& b, RandomEngine& rng) const override {
        if (value < b.lo || value > b.hi) return std::uniform_real_distribution<double>(b.lo, b.hi)(rng);
        return value;
    }

   private:
    std::shared_ptr<const NodeMutator> decorated_;
};

/// Заменить поле на случайные U(0, 1) значения, нормированные к сумме 1.
class RandomValuesSumTo1NodeMutator final : public NodeMutator {
   public:
    explicit RandomValuesSumTo1NodeMutator(ParamField field) : field_(field) {}

    void mutate(GeneratorNode& node, RandomEngine& rng) const override {
        auto& value = node.field(field_);
        std::uniform_real_distribution<double> u(0.0, 1.0);

        std::vector<double> values(value.size());
        double sum = 0.0;
        for (auto& v : values) {
            v = u(rng);
            sum += v;
        }
        for (auto& v : values) v /= sum;
        value = params::GridValue::fromScalars(values);
    }

   private:
    ParamField field_;
};

/// Заменить поле выборкой из Dir(multiplier, ..., multiplier).
class DirichletValuesSumTo1NodeMutator final : public NodeMutator {
   public:
    explicit DirichletValuesSumTo1NodeMutator(ParamField field, double multiplier = 1.0)
        : field_(field), multiplier_(multiplier) {
        if (!(multiplier > 0.0)) {
            throw std::invalid_argument("DirichletValuesSumTo1NodeMutator: multiplier must be positive");
        }
    }

    void mutate(GeneratorNode& node, RandomEngine& rng) const override {
        auto& value = node.field(field_);
        value = params::GridValue::fromScalars(detail::dirichlet(value.size(), multiplier_, rng));
    }

   private:
    ParamField field_;
    double multiplier_;
};

/// Мутация графа: выбрать узел и изменить его.
class Mutation {
   public:
    /// @throws std::invalid_argument если selector или mutator пуст.
    Mutation(std::shared_ptr<const NodeSelector> selector, std::shared_ptr<const NodeMutator> mutator)
        : selector_(std::move(selector)), mutator_(std::move(mutator)) {
        if (!selector_ || !mutator_) throw std::invalid_argument("Mutation: selector and mutator must be set");
    }

    GeneratorModel& apply(GeneratorModel& graph, RandomEngine& rng) const {
        mutator_->mutate(selector_->select(graph, rng), rng);
        return graph;
    }

   private:
    std::shared_ptr<const NodeSelector> selector_;
    std::shared_ptr<const NodeMutator> mutator_;
};

/// Мутация случайного узла.
[[nodiscard]] inline Mutation mutation(std::shared_ptr<const NodeMutator> mutator) {
    return Mutation(std::make_shared<RandomNodeSelector>(), std::move(mutator));
}

}  // namespace moebius::evol
