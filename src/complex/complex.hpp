#ifndef COMPLEX_H
#define COMPLEX_H

#include <vector>

class Complex {
    private:
        double re;
        double im;

    public:
        // Constructors
        Complex();
        Complex(const double& value);
        Complex(const double& real, const double& imag);

        // Getters
        double real() const;
        double imag() const;

        // Complex arithmetic operators
        Complex operator+(const Complex& w) const;
        Complex operator-(const Complex& w) const;
        Complex operator*(const Complex& w) const;
        Complex operator/(const Complex& w) const;
        Complex operator-() const;

        // Complex compound assignment operators
        Complex& operator+=(const Complex& w);
        Complex& operator-=(const Complex& w);
        Complex& operator*=(const Complex& w);

        // Scalar arithmetic operators
        Complex operator+(double scalar) const;
        Complex operator-(double scalar) const;
        Complex operator*(double scalar) const;
        Complex operator/(double scalar) const;

        // Scalar compound assignment operators
        Complex& operator*=(double scalar);
        Complex& operator/=(double scalar);

        // Mathmatical operations
        static Complex conj(const Complex& z);
        static double mag(const Complex& z);
        static double magSq(const Complex& z);
        static double arg(const Complex& z);

        // Precondition for both: mag(z) > 0, otherwise the result is NaN/inf
        static Complex normalized(const Complex& z);
        static Complex reciprocal(const Complex& z);

        static Complex exp(const Complex& z);
        static Complex tanh(const Complex& z);
        static Complex power(const Complex& z, int n);

        // All n roots, k-th root at angle (arg(z) + 2k*pi) / n. Empty for n == 0.
        static std::vector<Complex> root(const Complex& z, unsigned int n);
};

// Euler's formula e^it = cos(t) + i sin(t)
Complex versor(double t);

const Complex CMP_ZERO = Complex(0.0, 0.0);
const Complex CMP_ONE = Complex(1.0, 0.0);
const Complex CMP_I = Complex(0.0, 1.0);

#endif
