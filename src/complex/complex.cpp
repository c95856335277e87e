#include <cmath>

#include "complex.hpp"

// Constructors
Complex::Complex() : re(0.0), im(0.0) {}
Complex::Complex(const double& value) : re(value), im(0.0) {}
Complex::Complex(const double& real, const double& imag) : re(real), im(imag) {}

// Getters
double Complex::real() const { return re; }
double Complex::imag() const { return im; }

// Complex arithmetic operators
Complex Complex::operator+(const Complex& w) const {
    return Complex(re + w.re, im + w.im);
}

Complex Complex::operator-(const Complex& w) const {
    return Complex(re - w.re, im - w.im);
}

Complex Complex::operator*(const Complex& w) const {
    return Complex(re * w.re - im * w.im, re * w.im + im * w.re);
}

Complex Complex::operator/(const Complex& w) const {
    return *this * reciprocal(w);
}

Complex Complex::operator-() const {
    return Complex(-re, -im);
}

// Complex compound assignment operators
Complex& Complex::operator+=(const Complex& w) {
    re = re + w.re;
    im = im + w.im;
    return *this;
}

Complex& Complex::operator-=(const Complex& w) {
    re = re - w.re;
    im = im - w.im;
    return *this;
}

Complex& Complex::operator*=(const Complex& w) {
    double newRe = re * w.re - im * w.im;
    im = re * w.im + im * w.re;
    re = newRe;
    return *this;
}

// Scalar arithmetic operators
Complex Complex::operator+(double scalar) const { return Complex(re + scalar, im); }
Complex Complex::operator-(double scalar) const { return Complex(re - scalar, im); }
Complex Complex::operator*(double scalar) const { return Complex(re * scalar, im * scalar); }
Complex Complex::operator/(double scalar) const { return *this * (1.0 / scalar); }

// Scalar compound assignment operators
Complex& Complex::operator*=(double scalar) { re = re * scalar; im = im * scalar; return *this; }
Complex& Complex::operator/=(double scalar) { return *this *= 1.0 / scalar; }

// Mathmatical operations
Complex Complex::conj(const Complex& z) {
    return Complex(z.real(), -z.imag());
}

double Complex::mag(const Complex& z) {
    return std::sqrt(magSq(z));
}

double Complex::magSq(const Complex& z) {
    return z.real() * z.real() + z.imag() * z.imag();
}

double Complex::arg(const Complex& z) {
    return std::atan2(z.imag(), z.real());
}

Complex Complex::normalized(const Complex& z) {
    return z / mag(z);
}

Complex Complex::reciprocal(const Complex& z) {
    return conj(z) / magSq(z);
}

Complex Complex::exp(const Complex& z) {
    return versor(z.imag()) * std::exp(z.real());
}

Complex Complex::tanh(const Complex& z) {
    Complex e = exp(z * 2.0);
    return (e - CMP_ONE) / (e + CMP_ONE);
}

Complex Complex::power(const Complex& z, int n) {
    return versor(n * arg(z)) * std::pow(mag(z), n);
}

std::vector<Complex> Complex::root(const Complex& z, unsigned int n) {
    std::vector<Complex> roots;
    if (n == 0)
        return roots;

    double nthRootR = std::pow(mag(z), 1.0 / n);
    double phi = arg(z);

    roots.reserve(n);
    for (unsigned int k = 0; k < n; k++)
        roots.push_back(versor((phi + 2.0 * k * M_PI) / n) * nthRootR);

    return roots;
}

Complex versor(double t) {
    return Complex(std::cos(t), std::sin(t));
}
