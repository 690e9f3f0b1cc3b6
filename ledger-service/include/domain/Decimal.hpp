#pragma once

#include <cstdint>
#include <string>

namespace corebank::domain {

/**
 * @brief Десятичное число с фиксированной точкой (8 знаков после запятой)
 *
 * Хранится одним int64_t в единицах 10^-8, как Money в брокере хранит
 * units/nano: никакой double не участвует в расчёте баланса, паёв или комиссии.
 *
 * Денежные величины (балансы, суммы, комиссии, цены) округляются до 4 знаков
 * при каждой записи, паи до 8 знаков.
 *
 * Пример: 265.5 = {raw: 26550000000}
 */
class Decimal {
public:
    static constexpr int SCALE = 8;             ///< Знаков после запятой во внутреннем представлении
    static constexpr int MONEY_SCALE = 4;       ///< NUMERIC(19,4)
    static constexpr int SHARES_SCALE = 8;      ///< NUMERIC(19,8)
    static constexpr int64_t ONE = 100000000;   ///< 1.0 во внутреннем представлении

    Decimal() = default;

    static Decimal fromRaw(int64_t raw);
    static Decimal fromInt(int64_t units);

    /**
     * @brief Создать из целого числа младших единиц заданного масштаба
     *
     * fromMinorUnits(12345, 2) == 123.45
     *
     * @throws ValidationException если scale вне [0, 8] или переполнение
     */
    static Decimal fromMinorUnits(int64_t minorUnits, int scale);

    /**
     * @brief Разобрать строку вида "-123.4500"
     * @throws ValidationException при неверном формате или более чем 8 знаках дроби
     */
    static Decimal parse(const std::string& text);

    int64_t raw() const { return raw_; }

    /**
     * @brief Количество младших единиц масштаба scale (с округлением half-up)
     */
    int64_t toMinorUnits(int scale) const;

    /**
     * @brief Округлить до scale знаков (half-up, от нуля для отрицательных)
     */
    Decimal quantize(int scale) const;

    /**
     * @brief Строка с ровно scale знаками после запятой: "100.0000"
     */
    std::string toString(int scale = MONEY_SCALE) const;

    bool isZero() const { return raw_ == 0; }
    bool isNegative() const { return raw_ < 0; }
    bool isPositive() const { return raw_ > 0; }
    Decimal abs() const;

    /**
     * @brief a * b с округлением half-up до 8 знаков
     */
    static Decimal multiply(const Decimal& a, const Decimal& b);

    /**
     * @brief a / b с округлением half-up до 8 знаков
     * @throws ValidationException при делении на ноль
     */
    static Decimal divide(const Decimal& a, const Decimal& b);

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator-() const;
    Decimal operator*(const Decimal& other) const { return multiply(*this, other); }
    Decimal operator/(const Decimal& other) const { return divide(*this, other); }

    Decimal& operator+=(const Decimal& other) { return *this = *this + other; }
    Decimal& operator-=(const Decimal& other) { return *this = *this - other; }

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    explicit Decimal(int64_t raw) : raw_(raw) {}

    int64_t raw_ = 0;
};

} // namespace corebank::domain
