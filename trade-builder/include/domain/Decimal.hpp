#pragma once

#include <string>
#include <cstdint>
#include <ostream>

namespace tradebook::domain {

/**
 * @brief Десятичное число с фиксированной точкой (8 знаков после запятой)
 *
 * Хранит значение как целое количество 10^-8 долей. Сложение и вычитание
 * точные, умножение и деление округляют результат до 8 знаков
 * (half away from zero). Промежуточные произведения считаются в 128 битах.
 *
 * Используется для количеств, цен, комиссий и всех производных сумм,
 * чтобы результат пересборки не зависел от порядка вычислений с double.
 */
class Decimal {
public:
    static constexpr int FRACTION_DIGITS = 8;
    static constexpr int64_t SCALE = 100000000;

    Decimal() = default;

    /**
     * @brief Целое значение (например, Decimal(100) == 100.0)
     */
    Decimal(int64_t units);

    static Decimal fromRaw(int64_t raw);

    /**
     * @brief Разобрать строку вида "-123.456"
     * @throws std::invalid_argument если строка не является числом
     * @throws std::overflow_error если значение не помещается в диапазон
     */
    static Decimal fromString(const std::string& text);

    /**
     * @brief Перевести double с округлением до 8 знаков
     * @throws std::invalid_argument для NaN и бесконечностей
     */
    static Decimal fromDouble(double value);

    int64_t raw() const { return raw_; }
    double toDouble() const;

    /**
     * @brief Каноническая запись без лишних нулей ("150.25", "100", "-0.5")
     */
    std::string toString() const;

    bool isZero() const { return raw_ == 0; }
    bool isPositive() const { return raw_ > 0; }
    bool isNegative() const { return raw_ < 0; }

    Decimal abs() const;

    /**
     * @brief this * multiplier / divisor с одним округлением
     *
     * Нужен для пропорционального распределения (себестоимость закрытой
     * части позиции, доля комиссии), где двойное округление даёт дрейф.
     * @throws std::domain_error при делении на ноль
     */
    Decimal mulDiv(const Decimal& multiplier, const Decimal& divisor) const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator-() const;
    Decimal operator*(const Decimal& other) const;

    /**
     * @throws std::domain_error при делении на ноль
     */
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    int64_t raw_ = 0;
};

inline Decimal min(const Decimal& a, const Decimal& b) {
    return a < b ? a : b;
}

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace tradebook::domain
