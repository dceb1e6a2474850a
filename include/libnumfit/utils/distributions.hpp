#pragma once

#include <cmath>
#include <limits>

namespace libnumfit {
namespace utils {

/**
 * Statistical distribution functions used by the inference layer
 *
 * - log_gamma / log_beta: Lanczos approximation
 * - beta_inc_reg: regularized incomplete beta I_x(a, b) via Lentz's continued fraction
 * - Student's t: CDF, two-tailed p-value, upper critical value
 * - Fisher's F: CDF and upper-tail p-value
 *
 * Degrees of freedom are doubles so callers can pass size_t counts directly.
 */

/// log(Γ(x)) for x > 0
inline double log_gamma(double x) {
	constexpr double pi = 3.14159265358979323846;
	static const double coefficients[9] = {0.99999999999980993,  676.5203681218851,     -1259.1392167224028,
	                                       771.32342877765313,   -176.61502916214059,   12.507343278686905,
	                                       -0.13857109526572012, 9.9843695780195716e-6, 1.5056327351493116e-7};

	if (x < 0.5) {
		// Reflection: Γ(x)Γ(1-x) = π / sin(πx)
		return std::log(pi / std::abs(std::sin(pi * x))) - log_gamma(1.0 - x);
	}

	x -= 1.0;
	double a = coefficients[0];
	const double t = x + 7.5;
	for (int i = 1; i < 9; i++) {
		a += coefficients[i] / (x + static_cast<double>(i));
	}
	return 0.5 * std::log(2.0 * pi) + (x + 0.5) * std::log(t) - t + std::log(a);
}

/// log(B(a, b)) = log Γ(a) + log Γ(b) - log Γ(a + b)
inline double log_beta(double a, double b) {
	return log_gamma(a) + log_gamma(b) - log_gamma(a + b);
}

namespace detail {

// Continued fraction for the incomplete beta function (modified Lentz)
inline double beta_continued_fraction(double x, double a, double b) {
	constexpr int max_iterations = 500;
	constexpr double epsilon = 1e-15;
	constexpr double tiny = 1e-300;

	const double qab = a + b;
	const double qap = a + 1.0;
	const double qam = a - 1.0;

	double c = 1.0;
	double d = 1.0 - qab * x / qap;
	if (std::abs(d) < tiny) {
		d = tiny;
	}
	d = 1.0 / d;
	double h = d;

	for (int m = 1; m <= max_iterations; m++) {
		const double dm = static_cast<double>(m);
		const double m2 = 2.0 * dm;

		// Even step
		double aa = dm * (b - dm) * x / ((qam + m2) * (a + m2));
		d = 1.0 + aa * d;
		if (std::abs(d) < tiny) {
			d = tiny;
		}
		c = 1.0 + aa / c;
		if (std::abs(c) < tiny) {
			c = tiny;
		}
		d = 1.0 / d;
		h *= d * c;

		// Odd step
		aa = -(a + dm) * (qab + dm) * x / ((a + m2) * (qap + m2));
		d = 1.0 + aa * d;
		if (std::abs(d) < tiny) {
			d = tiny;
		}
		c = 1.0 + aa / c;
		if (std::abs(c) < tiny) {
			c = tiny;
		}
		d = 1.0 / d;
		const double delta = d * c;
		h *= delta;

		if (std::abs(delta - 1.0) < epsilon) {
			break;
		}
	}

	return h;
}

} // namespace detail

/**
 * Regularized incomplete beta function I_x(a, b)
 *
 * @param x Evaluation point in [0, 1]
 * @param a Shape parameter > 0
 * @param b Shape parameter > 0
 * @return I_x(a, b) in [0, 1]; NaN for invalid shape parameters
 */
inline double beta_inc_reg(double x, double a, double b) {
	if (!(a > 0.0) || !(b > 0.0) || std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 0.0;
	}
	if (x >= 1.0) {
		return 1.0;
	}

	const double log_front = a * std::log(x) + b * std::log1p(-x) - log_beta(a, b);
	const double front = std::exp(log_front);

	// Use the continued fraction directly where it converges fast,
	// otherwise the symmetry I_x(a,b) = 1 - I_{1-x}(b,a)
	if (x < (a + 1.0) / (a + b + 2.0)) {
		return front * detail::beta_continued_fraction(x, a, b) / a;
	}
	return 1.0 - front * detail::beta_continued_fraction(1.0 - x, b, a) / b;
}

/**
 * CDF of Student's t-distribution P(T <= t)
 *
 * Returns 0.5 for df <= 0 (undefined distribution, treated as uninformative).
 */
inline double student_t_cdf(double t, double df) {
	if (!(df > 0.0)) {
		return 0.5;
	}
	if (std::isinf(t)) {
		return t > 0.0 ? 1.0 : 0.0;
	}

	const double x = df / (df + t * t);
	const double tail = 0.5 * beta_inc_reg(x, 0.5 * df, 0.5);
	return t > 0.0 ? 1.0 - tail : tail;
}

/**
 * Two-tailed p-value P(|T| > |t|) for T ~ t(df)
 */
inline double student_t_pvalue(double t, double df) {
	if (std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (!(df > 0.0)) {
		return 1.0;
	}
	if (std::isinf(t)) {
		return 0.0;
	}
	const double x = df / (df + t * t);
	return beta_inc_reg(x, 0.5 * df, 0.5);
}

/**
 * Upper critical value of Student's t: the t with P(T > t) = alpha
 *
 * For a two-sided interval at confidence level L, call with alpha = (1 - L) / 2.
 * Solved by bracketing and bisection on the CDF.
 *
 * @param alpha Upper-tail probability in (0, 1)
 * @param df Degrees of freedom > 0
 * @return Critical value; NaN for invalid arguments
 */
inline double student_t_critical(double alpha, double df) {
	if (!(alpha > 0.0 && alpha < 1.0) || !(df > 0.0)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (alpha == 0.5) {
		return 0.0;
	}
	if (alpha > 0.5) {
		return -student_t_critical(1.0 - alpha, df);
	}

	const double target = 1.0 - alpha;
	double lo = 0.0;
	double hi = 1.0;
	while (student_t_cdf(hi, df) < target) {
		lo = hi;
		hi *= 2.0;
		if (hi > 1e12) {
			return std::numeric_limits<double>::infinity();
		}
	}

	for (int iter = 0; iter < 200; iter++) {
		const double mid = 0.5 * (lo + hi);
		if (student_t_cdf(mid, df) < target) {
			lo = mid;
		} else {
			hi = mid;
		}
		if (hi - lo <= 1e-13 * (1.0 + hi)) {
			break;
		}
	}
	return 0.5 * (lo + hi);
}

/**
 * CDF of the F-distribution P(F <= f) with (d1, d2) degrees of freedom
 */
inline double f_cdf(double f, double d1, double d2) {
	if (!(d1 > 0.0) || !(d2 > 0.0) || std::isnan(f)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (f <= 0.0) {
		return 0.0;
	}
	if (std::isinf(f)) {
		return 1.0;
	}
	return beta_inc_reg(d1 * f / (d1 * f + d2), 0.5 * d1, 0.5 * d2);
}

/**
 * Upper-tail p-value P(F > f) with (d1, d2) degrees of freedom
 *
 * Computed from the complementary incomplete beta so small p-values keep precision.
 */
inline double f_pvalue(double f, double d1, double d2) {
	if (!(d1 > 0.0) || !(d2 > 0.0) || std::isnan(f)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (f <= 0.0) {
		return 1.0;
	}
	if (std::isinf(f)) {
		return 0.0;
	}
	return beta_inc_reg(d2 / (d2 + d1 * f), 0.5 * d2, 0.5 * d1);
}

} // namespace utils
} // namespace libnumfit
