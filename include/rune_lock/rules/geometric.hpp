/**
 * @file geometric.hpp
 * @brief 位置関係ルール (alwanese, antakian, santor, conductive)
 */
#ifndef RUNE_LOCK_RULES_GEOMETRIC_HPP
#define RUNE_LOCK_RULES_GEOMETRIC_HPP

#include "rune_lock/rule.hpp"

namespace rune_lock {

/**
 * @brief second が first から見て1〜2つ先のセクタにある
 */
class AlwaneseRule : public ActivationPairRule {
public:
    AlwaneseRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
};

/**
 * @brief first と second が同じリング上で点対称
 */
class AntakianConjugatesRule : public ActivationPairRule {
public:
    AntakianConjugatesRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
    bool unfulfillable(const Lock& lock, const Assignment& assignment,
                       std::optional<Position> first,
                       std::optional<Position> second) const override;
};

/**
 * @brief first と second がリングを問わず対角のセクタにある
 */
class AlwaneseConjugatesRule : public ActivationPairRule {
public:
    AlwaneseConjugatesRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
};

/**
 * @brief first と second が同じリングにある
 */
class AntakianTwinsRule : public ActivationPairRule {
public:
    AntakianTwinsRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
};

/**
 * @brief second の santor が first より大きい
 */
class IncreaseSantorRule : public ActivationPairRule {
public:
    IncreaseSantorRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
    bool unfulfillable(const Lock& lock, const Assignment& assignment,
                       std::optional<Position> first,
                       std::optional<Position> second) const override;
};

/**
 * @brief first と second が二重リングの接続規則で隣接
 */
class Max0ConductiveRule : public ActivationPairRule {
public:
    Max0ConductiveRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
};

} // namespace rune_lock

#endif // RUNE_LOCK_RULES_GEOMETRIC_HPP
