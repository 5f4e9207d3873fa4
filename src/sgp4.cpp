/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Implementation
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#include <orbitcast/sgp4.hpp>

#include <cmath>

namespace orbitcast::sgp4 {

namespace {

// Solar and lunar constants
constexpr double ZES = 0.01675;
constexpr double ZEL = 0.05490;
constexpr double ZNS = 1.19459e-5;
constexpr double ZNL = 1.5835218e-4;
constexpr double C1SS = 2.9864797e-6;
constexpr double C1L = 4.7968065e-7;
constexpr double ZSINIS = 0.39785416;
constexpr double ZCOSIS = 0.91744867;
constexpr double ZCOSGS = 0.1945905;
constexpr double ZSINGS = -0.98088458;

// Resonance constants
constexpr double Q22 = 1.7891679e-6;
constexpr double Q31 = 2.1460748e-6;
constexpr double Q33 = 2.2123015e-7;
constexpr double ROOT22 = 1.7891679e-6;
constexpr double ROOT32 = 3.7393792e-7;
constexpr double ROOT44 = 7.3636953e-9;
constexpr double ROOT52 = 1.1428639e-7;
constexpr double ROOT54 = 2.1765803e-9;
constexpr double FASX2 = 0.13130908;
constexpr double FASX4 = 2.8843198;
constexpr double FASX6 = 0.37448087;
constexpr double G22 = 5.7686396;
constexpr double G32 = 0.95240898;
constexpr double G44 = 1.8014998;
constexpr double G52 = 1.0508330;
constexpr double G54 = 4.4108898;

// Integrator step (minutes)
constexpr double STEP = 720.0;
constexpr double STEP2 = 259200.0;

// Inclinations within this distance of 0 or pi are treated as equatorial
constexpr double EQUATORIAL_LIMIT = 5.2359877e-2;

/**
 * Third body terms from dscom. Index 0 of DeepSpaceCommon::body is the sun,
 * index 1 the moon.
 */
struct ThirdBodyTerms {
    double s1, s2, s3, s4, s5, s6, s7;
    double z1, z2, z3;
    double z11, z12, z13;
    double z21, z22, z23;
    double z31, z32, z33;
};

struct DeepSpaceCommon {
    double sinim, cosim;
    double emsq;
    double day, gam;
    ThirdBodyTerms body[2];
};

DeepSpaceCommon computeCommon(const State& state, double tc) {
    DeepSpaceCommon c{};

    double nm = state.no_unkozai;
    double em = state.ecco;
    double snodm = std::sin(state.nodeo);
    double cnodm = std::cos(state.nodeo);
    double sinomm = std::sin(state.argpo);
    double cosomm = std::cos(state.argpo);
    c.sinim = std::sin(state.inclo);
    c.cosim = std::cos(state.inclo);
    c.emsq = em * em;
    double betasq = 1.0 - c.emsq;
    double rtemsq = std::sqrt(betasq);

    // Days since 1900 Jan 0.5
    c.day = state.jdsatepoch + state.jdsatepochF - 2415020.0 + tc / 1440.0;
    double xnodce = std::fmod(4.5236020 - 9.2422029e-4 * c.day, TWO_PI);
    double stem = std::sin(xnodce);
    double ctem = std::cos(xnodce);
    double zcosil = 0.91375164 - 0.03568096 * ctem;
    double zsinil = std::sqrt(1.0 - zcosil * zcosil);
    double zsinhl = 0.089683511 * stem / zsinil;
    double zcoshl = std::sqrt(1.0 - zsinhl * zsinhl);
    c.gam = 5.8351514 + 0.0019443680 * c.day;
    double zx = 0.39785416 * stem / zsinil;
    double zy = zcoshl * ctem + 0.91744867 * zsinhl * stem;
    zx = std::atan2(zx, zy);
    zx = c.gam + zx - xnodce;
    double zcosgl = std::cos(zx);
    double zsingl = std::sin(zx);

    double zcosg = ZCOSGS;
    double zsing = ZSINGS;
    double zcosi = ZCOSIS;
    double zsini = ZSINIS;
    double zcosh = cnodm;
    double zsinh = snodm;
    double cc = C1SS;
    double xnoi = 1.0 / nm;

    for (ThirdBodyTerms& t : c.body) {
        double a1 = zcosg * zcosh + zsing * zcosi * zsinh;
        double a3 = -zsing * zcosh + zcosg * zcosi * zsinh;
        double a7 = -zcosg * zsinh + zsing * zcosi * zcosh;
        double a8 = zsing * zsini;
        double a9 = zsing * zsinh + zcosg * zcosi * zcosh;
        double a10 = zcosg * zsini;
        double a2 = c.cosim * a7 + c.sinim * a8;
        double a4 = c.cosim * a9 + c.sinim * a10;
        double a5 = -c.sinim * a7 + c.cosim * a8;
        double a6 = -c.sinim * a9 + c.cosim * a10;

        double x1 = a1 * cosomm + a2 * sinomm;
        double x2 = a3 * cosomm + a4 * sinomm;
        double x3 = -a1 * sinomm + a2 * cosomm;
        double x4 = -a3 * sinomm + a4 * cosomm;
        double x5 = a5 * sinomm;
        double x6 = a6 * sinomm;
        double x7 = a5 * cosomm;
        double x8 = a6 * cosomm;

        t.z31 = 12.0 * x1 * x1 - 3.0 * x3 * x3;
        t.z32 = 24.0 * x1 * x2 - 6.0 * x3 * x4;
        t.z33 = 12.0 * x2 * x2 - 3.0 * x4 * x4;
        t.z1 = 3.0 * (a1 * a1 + a2 * a2) + t.z31 * c.emsq;
        t.z2 = 6.0 * (a1 * a3 + a2 * a4) + t.z32 * c.emsq;
        t.z3 = 3.0 * (a3 * a3 + a4 * a4) + t.z33 * c.emsq;
        t.z11 = -6.0 * a1 * a5 + c.emsq * (-24.0 * x1 * x7 - 6.0 * x3 * x5);
        t.z12 = -6.0 * (a1 * a6 + a3 * a5) + c.emsq * (-24.0 * (x2 * x7 + x1 * x8) - 6.0 * (x3 * x6 + x4 * x5));
        t.z13 = -6.0 * a3 * a6 + c.emsq * (-24.0 * x2 * x8 - 6.0 * x4 * x6);
        t.z21 = 6.0 * a2 * a5 + c.emsq * (24.0 * x1 * x5 - 6.0 * x3 * x7);
        t.z22 = 6.0 * (a4 * a5 + a2 * a6) + c.emsq * (24.0 * (x2 * x5 + x1 * x6) - 6.0 * (x4 * x7 + x3 * x8));
        t.z23 = 6.0 * a4 * a6 + c.emsq * (24.0 * x2 * x6 - 6.0 * x4 * x8);
        t.z1 = t.z1 + t.z1 + betasq * t.z31;
        t.z2 = t.z2 + t.z2 + betasq * t.z32;
        t.z3 = t.z3 + t.z3 + betasq * t.z33;
        t.s3 = cc * xnoi;
        t.s2 = -0.5 * t.s3 / rtemsq;
        t.s4 = t.s3 * rtemsq;
        t.s1 = -15.0 * em * t.s4;
        t.s5 = x1 * x3 + x2 * x4;
        t.s6 = x2 * x3 + x1 * x4;
        t.s7 = x2 * x4 - x1 * x3;

        // Switch to lunar geometry for the second pass
        zcosg = zcosgl;
        zsing = zsingl;
        zcosi = zcosil;
        zsini = zsinil;
        zcosh = zcoshl * cnodm + zsinhl * snodm;
        zsinh = snodm * zcoshl - cnodm * zsinhl;
        cc = C1L;
    }

    return c;
}

// Store the lunar-solar periodic coefficients (second half of dscom)
void storePeriodicCoefficients(State& state, const DeepSpaceCommon& c) {
    const ThirdBodyTerms& sun = c.body[0];
    const ThirdBodyTerms& moon = c.body[1];

    state.zmol = std::fmod(4.7199672 + 0.22997150 * c.day - c.gam, TWO_PI);
    state.zmos = std::fmod(6.2565837 + 0.017201977 * c.day, TWO_PI);

    state.se2 = 2.0 * sun.s1 * sun.s6;
    state.se3 = 2.0 * sun.s1 * sun.s7;
    state.si2 = 2.0 * sun.s2 * sun.z12;
    state.si3 = 2.0 * sun.s2 * (sun.z13 - sun.z11);
    state.sl2 = -2.0 * sun.s3 * sun.z2;
    state.sl3 = -2.0 * sun.s3 * (sun.z3 - sun.z1);
    state.sl4 = -2.0 * sun.s3 * (-21.0 - 9.0 * c.emsq) * ZES;
    state.sgh2 = 2.0 * sun.s4 * sun.z32;
    state.sgh3 = 2.0 * sun.s4 * (sun.z33 - sun.z31);
    state.sgh4 = -18.0 * sun.s4 * ZES;
    state.sh2 = -2.0 * sun.s2 * sun.z22;
    state.sh3 = -2.0 * sun.s2 * (sun.z23 - sun.z21);

    state.ee2 = 2.0 * moon.s1 * moon.s6;
    state.e3 = 2.0 * moon.s1 * moon.s7;
    state.xi2 = 2.0 * moon.s2 * moon.z12;
    state.xi3 = 2.0 * moon.s2 * (moon.z13 - moon.z11);
    state.xl2 = -2.0 * moon.s3 * moon.z2;
    state.xl3 = -2.0 * moon.s3 * (moon.z3 - moon.z1);
    state.xl4 = -2.0 * moon.s3 * (-21.0 - 9.0 * c.emsq) * ZEL;
    state.xgh2 = 2.0 * moon.s4 * moon.z32;
    state.xgh3 = 2.0 * moon.s4 * (moon.z33 - moon.z31);
    state.xgh4 = -18.0 * moon.s4 * ZEL;
    state.xh2 = -2.0 * moon.s2 * moon.z22;
    state.xh3 = -2.0 * moon.s2 * (moon.z23 - moon.z21);
}

// Secular rates and resonance terms for deep space orbits (dsinit)
void initializeDeepSpace(State& state, const DeepSpaceCommon& c, double tc) {
    const ThirdBodyTerms& sun = c.body[0];
    const ThirdBodyTerms& moon = c.body[1];
    double sinim = c.sinim;
    double cosim = c.cosim;
    double emsq = c.emsq;
    double nm = state.no_unkozai;
    bool equatorial = state.inclo < EQUATORIAL_LIMIT || state.inclo > M_PI - EQUATORIAL_LIMIT;

    state.irez = 0;
    if (nm < 0.0052359877 && nm > 0.0034906585) {
        state.irez = 1;
    }
    if (nm >= 8.26e-3 && nm <= 9.24e-3 && state.ecco >= 0.5) {
        state.irez = 2;
    }

    // Solar secular terms
    double ses = sun.s1 * ZNS * sun.s5;
    double sis = sun.s2 * ZNS * (sun.z11 + sun.z13);
    double sls = -ZNS * sun.s3 * (sun.z1 + sun.z3 - 14.0 - 6.0 * emsq);
    double sghs = sun.s4 * ZNS * (sun.z31 + sun.z33 - 6.0);
    double shs = -ZNS * sun.s2 * (sun.z21 + sun.z23);
    if (equatorial) {
        shs = 0.0;
    }
    if (sinim != 0.0) {
        shs = shs / sinim;
    }
    double sgs = sghs - cosim * shs;

    // Lunar secular terms
    state.dedt = ses + moon.s1 * ZNL * moon.s5;
    state.didt = sis + moon.s2 * ZNL * (moon.z11 + moon.z13);
    state.dmdt = sls - ZNL * moon.s3 * (moon.z1 + moon.z3 - 14.0 - 6.0 * emsq);
    double sghl = moon.s4 * ZNL * (moon.z31 + moon.z33 - 6.0);
    double shll = -ZNL * moon.s2 * (moon.z21 + moon.z23);
    if (equatorial) {
        shll = 0.0;
    }
    state.domdt = sgs + sghl;
    state.dnodt = shs;
    if (sinim != 0.0) {
        state.domdt = state.domdt - cosim / sinim * shll;
        state.dnodt = state.dnodt + shll / sinim;
    }

    if (state.irez == 0) {
        return;
    }

    double theta = std::fmod(state.gsto + tc * EARTH_ROTATION_RATE, TWO_PI);
    double aonv = std::pow(nm / XKE, X2O3);

    if (state.irez == 2) {
        // Half-day resonance terms
        double cosisq = cosim * cosim;
        double em = state.ecco;
        double eoc = em * emsq;
        double g201 = -0.306 - (em - 0.64) * 0.440;
        double g211, g310, g322, g410, g422, g520, g521, g532, g533;

        if (em <= 0.65) {
            g211 = 3.616 - 13.2470 * em + 16.2900 * emsq;
            g310 = -19.302 + 117.3900 * em - 228.4190 * emsq + 156.5910 * eoc;
            g322 = -18.9068 + 109.7927 * em - 214.6334 * emsq + 146.5816 * eoc;
            g410 = -41.122 + 242.6940 * em - 471.0940 * emsq + 313.9530 * eoc;
            g422 = -146.407 + 841.8800 * em - 1629.014 * emsq + 1083.4350 * eoc;
            g520 = -532.114 + 3017.977 * em - 5740.032 * emsq + 3708.2760 * eoc;
        } else {
            g211 = -72.099 + 331.819 * em - 508.738 * emsq + 266.724 * eoc;
            g310 = -346.844 + 1582.851 * em - 2415.925 * emsq + 1246.113 * eoc;
            g322 = -342.585 + 1554.908 * em - 2366.899 * emsq + 1215.972 * eoc;
            g410 = -1052.797 + 4758.686 * em - 7193.992 * emsq + 3651.957 * eoc;
            g422 = -3581.690 + 16178.110 * em - 24462.770 * emsq + 12422.520 * eoc;
            if (em > 0.715) {
                g520 = -5149.66 + 29936.92 * em - 54087.36 * emsq + 31324.56 * eoc;
            } else {
                g520 = 1464.74 - 4664.75 * em + 3763.64 * emsq;
            }
        }

        if (em < 0.7) {
            g533 = -919.22770 + 4988.6100 * em - 9064.7700 * emsq + 5542.21 * eoc;
            g521 = -822.71072 + 4568.6173 * em - 8491.4146 * emsq + 5337.524 * eoc;
            g532 = -853.66600 + 4690.2500 * em - 8624.7700 * emsq + 5341.4 * eoc;
        } else {
            g533 = -37995.780 + 161616.52 * em - 229838.20 * emsq + 109377.94 * eoc;
            g521 = -51752.104 + 218913.95 * em - 309468.16 * emsq + 146349.42 * eoc;
            g532 = -40023.880 + 170470.89 * em - 242699.48 * emsq + 115605.82 * eoc;
        }

        double sini2 = sinim * sinim;
        double f220 = 0.75 * (1.0 + 2.0 * cosim + cosisq);
        double f221 = 1.5 * sini2;
        double f321 = 1.875 * sinim * (1.0 - 2.0 * cosim - 3.0 * cosisq);
        double f322 = -1.875 * sinim * (1.0 + 2.0 * cosim - 3.0 * cosisq);
        double f441 = 35.0 * sini2 * f220;
        double f442 = 39.3750 * sini2 * sini2;
        double f522 = 9.84375 * sinim * (sini2 * (1.0 - 2.0 * cosim - 5.0 * cosisq) +
                      0.33333333 * (-2.0 + 4.0 * cosim + 6.0 * cosisq));
        double f523 = sinim * (4.92187512 * sini2 * (-2.0 - 4.0 * cosim + 10.0 * cosisq) +
                      6.56250012 * (1.0 + 2.0 * cosim - 3.0 * cosisq));
        double f542 = 29.53125 * sinim * (2.0 - 8.0 * cosim + cosisq * (-12.0 + 8.0 * cosim + 10.0 * cosisq));
        double f543 = 29.53125 * sinim * (-2.0 - 8.0 * cosim + cosisq * (12.0 + 8.0 * cosim - 10.0 * cosisq));

        double xno2 = nm * nm;
        double ainv2 = aonv * aonv;
        double temp1 = 3.0 * xno2 * ainv2;
        double temp = temp1 * ROOT22;
        state.d2201 = temp * f220 * g201;
        state.d2211 = temp * f221 * g211;
        temp1 = temp1 * aonv;
        temp = temp1 * ROOT32;
        state.d3210 = temp * f321 * g310;
        state.d3222 = temp * f322 * g322;
        temp1 = temp1 * aonv;
        temp = 2.0 * temp1 * ROOT44;
        state.d4410 = temp * f441 * g410;
        state.d4422 = temp * f442 * g422;
        temp1 = temp1 * aonv;
        temp = temp1 * ROOT52;
        state.d5220 = temp * f522 * g520;
        state.d5232 = temp * f523 * g532;
        temp = 2.0 * temp1 * ROOT54;
        state.d5421 = temp * f542 * g521;
        state.d5433 = temp * f543 * g533;

        state.xlamo = std::fmod(state.mo + state.nodeo + state.nodeo - theta - theta, TWO_PI);
        state.xfact = state.mdot + state.dmdt + 2.0 * (state.nodedot + state.dnodt - EARTH_ROTATION_RATE) - nm;
    } else {
        // Synchronous resonance terms
        double g200 = 1.0 + emsq * (-2.5 + 0.8125 * emsq);
        double g310 = 1.0 + 2.0 * emsq;
        double g300 = 1.0 + emsq * (-6.0 + 6.60937 * emsq);
        double f220 = 0.75 * (1.0 + cosim) * (1.0 + cosim);
        double f311 = 0.9375 * sinim * sinim * (1.0 + 3.0 * cosim) - 0.75 * (1.0 + cosim);
        double f330 = 1.0 + cosim;
        f330 = 1.875 * f330 * f330 * f330;

        state.del1 = 3.0 * nm * nm * aonv * aonv;
        state.del2 = 2.0 * state.del1 * f220 * g200 * Q22;
        state.del3 = 3.0 * state.del1 * f330 * g300 * Q33 * aonv;
        state.del1 = state.del1 * f311 * g310 * Q31 * aonv;

        state.xlamo = std::fmod(state.mo + state.nodeo + state.argpo - theta, TWO_PI);
        double xpidot = state.argpdot + state.nodedot;
        state.xfact = state.mdot + xpidot - EARTH_ROTATION_RATE + state.dmdt + state.domdt + state.dnodt - nm;
    }

    state.xli = state.xlamo;
    state.xni = nm;
    state.atime = 0.0;
}

// Resonance derivatives at the current integrator position
struct ResonanceRates {
    double xndt;
    double xnddt;
    double xldot;
};

ResonanceRates resonanceRates(const State& state, double atime, double xli, double xni) {
    ResonanceRates rates{};
    rates.xldot = xni + state.xfact;

    if (state.irez != 2) {
        rates.xndt = state.del1 * std::sin(xli - FASX2) +
                     state.del2 * std::sin(2.0 * (xli - FASX4)) +
                     state.del3 * std::sin(3.0 * (xli - FASX6));
        rates.xnddt = state.del1 * std::cos(xli - FASX2) +
                      2.0 * state.del2 * std::cos(2.0 * (xli - FASX4)) +
                      3.0 * state.del3 * std::cos(3.0 * (xli - FASX6));
    } else {
        double xomi = state.argpo + state.argpdot * atime;
        double x2omi = xomi + xomi;
        double x2li = xli + xli;
        rates.xndt = state.d2201 * std::sin(x2omi + xli - G22) +
                     state.d2211 * std::sin(xli - G22) +
                     state.d3210 * std::sin(xomi + xli - G32) +
                     state.d3222 * std::sin(-xomi + xli - G32) +
                     state.d4410 * std::sin(x2omi + x2li - G44) +
                     state.d4422 * std::sin(x2li - G44) +
                     state.d5220 * std::sin(xomi + xli - G52) +
                     state.d5232 * std::sin(-xomi + xli - G52) +
                     state.d5421 * std::sin(xomi + x2li - G54) +
                     state.d5433 * std::sin(-xomi + x2li - G54);
        rates.xnddt = state.d2201 * std::cos(x2omi + xli - G22) +
                      state.d2211 * std::cos(xli - G22) +
                      state.d3210 * std::cos(xomi + xli - G32) +
                      state.d3222 * std::cos(-xomi + xli - G32) +
                      state.d5220 * std::cos(xomi + xli - G52) +
                      state.d5232 * std::cos(-xomi + xli - G52) +
                      2.0 * (state.d4410 * std::cos(x2omi + x2li - G44) +
                             state.d4422 * std::cos(x2li - G44) +
                             state.d5421 * std::cos(xomi + x2li - G54) +
                             state.d5433 * std::cos(-xomi + x2li - G54));
    }
    rates.xnddt *= rates.xldot;
    return rates;
}

// Apply deep space secular effects and resonance integration (dspace)
void deepSpaceSecular(
    const State& state,
    double t, double& em, double& argpm, double& inclm,
    double& nodem, double& mm, double& nm,
    double& atime, double& xli, double& xni) {

    double theta = std::fmod(state.gsto + t * EARTH_ROTATION_RATE, TWO_PI);

    em += state.dedt * t;
    inclm += state.didt * t;
    argpm += state.domdt * t;
    nodem += state.dnodt * t;
    mm += state.dmdt * t;

    atime = state.atime;
    xli = state.xli;
    xni = state.xni;

    if (state.irez == 0) {
        return;
    }

    // Restart the integrator from epoch when t moves backwards past it
    if (atime == 0.0 || t * atime <= 0.0 || std::abs(t) < std::abs(atime)) {
        atime = 0.0;
        xni = state.no_unkozai;
        xli = state.xlamo;
    }

    double delt = t > 0.0 ? STEP : -STEP;
    ResonanceRates rates = resonanceRates(state, atime, xli, xni);
    while (std::abs(t - atime) >= STEP) {
        xli += rates.xldot * delt + rates.xndt * STEP2;
        xni += rates.xndt * delt + rates.xnddt * STEP2;
        atime += delt;
        rates = resonanceRates(state, atime, xli, xni);
    }

    double ft = t - atime;
    nm = xni + rates.xndt * ft + rates.xnddt * ft * ft * 0.5;
    double xl = xli + rates.xldot * ft + rates.xndt * ft * ft * 0.5;
    if (state.irez != 1) {
        mm = xl - 2.0 * nodem + 2.0 * theta;
    } else {
        mm = xl - nodem - argpm + theta;
    }
}

// Apply lunar-solar periodic effects (dpper)
void deepSpacePeriodic(
    const State& state,
    double t, double& ep, double& inclp, double& nodep,
    double& argpp, double& mp) {

    double zm = state.zmos + ZNS * t;
    double zf = zm + 2.0 * ZES * std::sin(zm);
    double sinzf = std::sin(zf);
    double f2 = 0.5 * sinzf * sinzf - 0.25;
    double f3 = -0.5 * sinzf * std::cos(zf);

    double ses = state.se2 * f2 + state.se3 * f3;
    double sis = state.si2 * f2 + state.si3 * f3;
    double sls = state.sl2 * f2 + state.sl3 * f3 + state.sl4 * sinzf;
    double sghs = state.sgh2 * f2 + state.sgh3 * f3 + state.sgh4 * sinzf;
    double shs = state.sh2 * f2 + state.sh3 * f3;

    zm = state.zmol + ZNL * t;
    zf = zm + 2.0 * ZEL * std::sin(zm);
    sinzf = std::sin(zf);
    f2 = 0.5 * sinzf * sinzf - 0.25;
    f3 = -0.5 * sinzf * std::cos(zf);

    double sel = state.ee2 * f2 + state.e3 * f3;
    double sil = state.xi2 * f2 + state.xi3 * f3;
    double sll = state.xl2 * f2 + state.xl3 * f3 + state.xl4 * sinzf;
    double sghl = state.xgh2 * f2 + state.xgh3 * f3 + state.xgh4 * sinzf;
    double shll = state.xh2 * f2 + state.xh3 * f3;

    double pe = ses + sel;
    double pinc = sis + sil;
    double pl = sls + sll;
    double pgh = sghs + sghl;
    double ph = shs + shll;

    inclp += pinc;
    ep += pe;
    double sinip = std::sin(inclp);
    double cosip = std::cos(inclp);

    if (inclp >= 0.2) {
        ph = ph / sinip;
        pgh = pgh - cosip * ph;
        argpp += pgh;
        nodep += ph;
        mp += pl;
        return;
    }

    // Lyddane modification for low inclinations
    double sinop = std::sin(nodep);
    double cosop = std::cos(nodep);
    double alfdp = sinip * sinop;
    double betdp = sinip * cosop;
    double dalf = ph * cosop + pinc * cosip * sinop;
    double dbet = -ph * sinop + pinc * cosip * cosop;
    alfdp += dalf;
    betdp += dbet;
    nodep = std::fmod(nodep, TWO_PI);
    if (nodep < 0.0) {
        nodep += TWO_PI;
    }
    double xls = mp + argpp + cosip * nodep;
    double dls = pl + pgh - pinc * nodep * sinip;
    xls += dls;
    double xnoh = nodep;
    nodep = std::atan2(alfdp, betdp);
    if (nodep < 0.0) {
        nodep += TWO_PI;
    }
    if (std::abs(xnoh - nodep) > M_PI) {
        if (nodep < xnoh) {
            nodep += TWO_PI;
        } else {
            nodep -= TWO_PI;
        }
    }
    mp += pl;
    argpp = xls - mp - cosip * nodep;
}

} // namespace

// Compute Greenwich Sidereal Time at epoch for SGP4
double gstime(double jdut1) {
    double tut1 = (jdut1 - 2451545.0) / 36525.0;
    double temp = -6.2e-6 * tut1 * tut1 * tut1
                  + 0.093104 * tut1 * tut1
                  + (876600.0 * 3600 + 8640184.812866) * tut1
                  + 67310.54841;
    constexpr double DEG_TO_RAD = M_PI / 180.0;
    temp = std::fmod(temp * DEG_TO_RAD / 240.0, TWO_PI);
    if (temp < 0.0) temp += TWO_PI;
    return temp;
}

void initialize(State& state, const Elements& elements) {
    state = State{};

    state.ecco = elements.eccentricity;
    state.inclo = elements.inclination;
    state.nodeo = elements.raan;
    state.argpo = elements.arg_perigee;
    state.mo = elements.mean_anomaly;
    state.bstar = elements.bstar;
    state.no_kozai = elements.mean_motion;

    state.jdsatepoch = std::floor(elements.epoch_jd);
    state.jdsatepochF = elements.epoch_jd - state.jdsatepoch;
    state.gsto = gstime(elements.epoch_jd);

    if (state.no_kozai <= 0.0) {
        throw InvalidOrbitException(MEAN_MOTION_NOT_POSITIVE,
            "Mean motion must be positive: " + std::to_string(state.no_kozai));
    }
    if (state.ecco >= 1.0 || state.ecco < 0.0) {
        throw InvalidOrbitException(MEAN_ECCENTRICITY_OUT_OF_RANGE,
            "Eccentricity out of range: " + std::to_string(state.ecco));
    }

    // Recover original mean motion (no_unkozai) and semimajor axis from input
    double cosio = std::cos(state.inclo);
    double sinio = std::sin(state.inclo);
    double cosio2 = cosio * cosio;
    double eccsq = state.ecco * state.ecco;
    double omeosq = 1.0 - eccsq;
    double rteosq = std::sqrt(omeosq);

    double ak = std::pow(XKE / state.no_kozai, X2O3);
    double d1 = 0.75 * J2 * (3.0 * cosio2 - 1.0) / (rteosq * omeosq);
    double del = d1 / (ak * ak);
    double adel = ak * (1.0 - del * del - del * (1.0 / 3.0 + 134.0 * del * del / 81.0));
    del = d1 / (adel * adel);
    state.no_unkozai = state.no_kozai / (1.0 + del);

    double ao = std::pow(XKE / state.no_unkozai, X2O3);
    state.a = ao;
    state.con41 = 3.0 * cosio2 - 1.0;
    state.x1mth2 = 1.0 - cosio2;
    state.x7thm1 = 7.0 * cosio2 - 1.0;

    double rp = ao * (1.0 - state.ecco);
    if (rp < 1.0) {
        throw InvalidOrbitException(SUB_ORBITAL, "Epoch elements are sub-orbital");
    }

    // Perigees below 220 km use the simplified drag model
    state.isimp = rp < (220.0 / RADIUS_EARTH_KM + 1.0);

    double ss = 78.0 / RADIUS_EARTH_KM + 1.0;
    double qzms2t = std::pow((120.0 - 78.0) / RADIUS_EARTH_KM, 4);
    double sfour = ss;
    double qzms24 = qzms2t;
    double perige = (rp - 1.0) * RADIUS_EARTH_KM;

    // For perigees below 156 km, adjust s and qoms2t
    if (perige < 156.0) {
        sfour = perige - 78.0;
        if (perige < 98.0) {
            sfour = 20.0;
        }
        qzms24 = std::pow((120.0 - sfour) / RADIUS_EARTH_KM, 4);
        sfour = sfour / RADIUS_EARTH_KM + 1.0;
    }

    double posq = (ao * omeosq) * (ao * omeosq);
    double pinvsq = 1.0 / posq;
    double tsi = 1.0 / (ao - sfour);
    state.eta = ao * state.ecco * tsi;
    double etasq = state.eta * state.eta;
    double eeta = state.ecco * state.eta;
    double psisq = std::abs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4);
    double coef1 = coef / std::pow(psisq, 3.5);
    double cc2 = coef1 * state.no_unkozai * (ao * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq)) +
                 0.375 * J2 * tsi / psisq * state.con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    state.cc1 = state.bstar * cc2;
    double cc3 = 0.0;
    if (state.ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * J3OJ2 * state.no_unkozai * sinio / state.ecco;
    }
    state.cc4 = 2.0 * state.no_unkozai * coef1 * ao * omeosq *
                (state.eta * (2.0 + 0.5 * etasq) + state.ecco * (0.5 + 2.0 * etasq) -
                 J2 * tsi / (ao * psisq) *
                 (-3.0 * state.con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta)) +
                  0.75 * state.x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * std::cos(2.0 * state.argpo)));
    state.cc5 = 2.0 * coef1 * ao * omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    double cosio4 = cosio2 * cosio2;
    double temp1 = 1.5 * J2 * pinvsq * state.no_unkozai;
    double temp2 = 0.5 * temp1 * J2 * pinvsq;
    double temp3 = -0.46875 * J4 * pinvsq * pinvsq * state.no_unkozai;
    state.mdot = state.no_unkozai + 0.5 * temp1 * rteosq * state.con41 +
                 0.0625 * temp2 * rteosq * (13.0 - 78.0 * cosio2 + 137.0 * cosio4);
    state.argpdot = -0.5 * temp1 * (1.0 - 5.0 * cosio2) +
                    0.0625 * temp2 * (7.0 - 114.0 * cosio2 + 395.0 * cosio4) +
                    temp3 * (3.0 - 36.0 * cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * cosio;
    state.nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * cosio2) + 2.0 * temp3 * (3.0 - 7.0 * cosio2)) * cosio;
    state.omgcof = state.bstar * cc3 * std::cos(state.argpo);
    state.xmcof = 0.0;
    if (state.ecco > 1.0e-4) {
        state.xmcof = -X2O3 * coef * state.bstar / eeta;
    }
    state.nodecf = 3.5 * omeosq * xhdot1 * state.cc1;
    state.t2cof = 1.5 * state.cc1;

    // Avoid division by zero for inclinations near 180 degrees
    double denominator = (std::abs(cosio + 1.0) > 1.5e-12) ? (1.0 + cosio) : 1.5e-12;
    state.xlcof = -0.25 * J3OJ2 * sinio * (3.0 + 5.0 * cosio) / denominator;
    state.aycof = -0.5 * J3OJ2 * sinio;

    state.delmo = std::pow(1.0 + state.eta * std::cos(state.mo), 3);
    state.sinmao = std::sin(state.mo);

    // Deep space when the period is 225 minutes or more
    if (TWO_PI / state.no_unkozai >= 225.0) {
        state.method = 'd';
        state.isimp = true;
        constexpr double tc = 0.0;
        DeepSpaceCommon common = computeCommon(state, tc);
        storePeriodicCoefficients(state, common);
        initializeDeepSpace(state, common, tc);
    }

    if (!state.isimp) {
        double c1sq = state.cc1 * state.cc1;
        state.d2 = 4.0 * ao * tsi * c1sq;
        double temp = state.d2 * tsi * state.cc1 / 3.0;
        state.d3 = (17.0 * ao + sfour) * temp;
        state.d4 = 0.5 * temp * ao * tsi * (221.0 * ao + 31.0 * sfour) * state.cc1;
        state.t3cof = state.d2 + 2.0 * c1sq;
        state.t4cof = 0.25 * (3.0 * state.d3 + state.cc1 * (12.0 * state.d2 + 10.0 * c1sq));
        state.t5cof = 0.2 * (3.0 * state.d4 + 12.0 * state.cc1 * state.d3 + 6.0 * state.d2 * state.d2 +
                             15.0 * c1sq * (2.0 * state.d2 + c1sq));
    }

    state.initialized = true;

    // Propagating to epoch surfaces any remaining model error
    propagate(state, 0.0);
}

Result propagate(const State& state, double tsince) {
    Result result{};

    // Update for secular gravity and atmospheric drag
    double xmdf = state.mo + state.mdot * tsince;
    double argpdf = state.argpo + state.argpdot * tsince;
    double nodedf = state.nodeo + state.nodedot * tsince;
    double argpm = argpdf;
    double mm = xmdf;
    double t2 = tsince * tsince;
    double nodem = nodedf + state.nodecf * t2;
    double tempa = 1.0 - state.cc1 * tsince;
    double tempe = state.bstar * state.cc4 * tsince;
    double templ = state.t2cof * t2;

    if (!state.isimp) {
        double delomg = state.omgcof * tsince;
        double delm = state.xmcof * (std::pow(1.0 + state.eta * std::cos(xmdf), 3) - state.delmo);
        double temp = delomg + delm;
        mm = xmdf + temp;
        argpm = argpdf - temp;
        double t3 = t2 * tsince;
        double t4 = t3 * tsince;
        tempa = tempa - state.d2 * t2 - state.d3 * t3 - state.d4 * t4;
        tempe = tempe + state.bstar * state.cc5 * (std::sin(mm) - state.sinmao);
        templ = templ + state.t3cof * t3 + t4 * (state.t4cof + tsince * state.t5cof);
    }

    double nm = state.no_unkozai;
    double em = state.ecco;
    double inclm = state.inclo;

    double atime = state.atime;
    double xli = state.xli;
    double xni = state.xni;

    if (state.method == 'd') {
        deepSpaceSecular(state, tsince, em, argpm, inclm, nodem, mm, nm, atime, xli, xni);
    }

    if (nm <= 0.0) {
        throw InvalidOrbitException(MEAN_MOTION_NOT_POSITIVE, "Mean motion is not positive during propagation");
    }

    double am = std::pow(XKE / nm, X2O3) * tempa * tempa;
    nm = XKE / std::pow(am, 1.5);
    em = em - tempe;

    if (em >= 1.0 || em < -0.001) {
        throw InvalidOrbitException(MEAN_ECCENTRICITY_OUT_OF_RANGE,
            "Eccentricity out of range during propagation: " + std::to_string(em));
    }
    if (em < 1.0e-6) {
        em = 1.0e-6;
    }

    mm = mm + state.no_unkozai * templ;
    double xlm = mm + argpm + nodem;

    nodem = std::fmod(nodem, TWO_PI);
    argpm = std::fmod(argpm, TWO_PI);
    xlm = std::fmod(xlm, TWO_PI);
    mm = std::fmod(xlm - argpm - nodem, TWO_PI);

    double ep = em;
    double xincp = inclm;
    double argpp = argpm;
    double nodep = nodem;
    double mp = mm;

    double aycof = state.aycof;
    double xlcof = state.xlcof;
    double con41 = state.con41;
    double x1mth2 = state.x1mth2;
    double x7thm1 = state.x7thm1;

    if (state.method == 'd') {
        deepSpacePeriodic(state, tsince, ep, xincp, nodep, argpp, mp);
        if (xincp < 0.0) {
            xincp = -xincp;
            nodep = nodep + M_PI;
            argpp = argpp - M_PI;
        }
        if (ep < 0.0 || ep > 1.0) {
            throw InvalidOrbitException(PERTURBED_ECCENTRICITY_OUT_OF_RANGE,
                "Perturbed eccentricity out of range: " + std::to_string(ep));
        }
    }

    double sinip = std::sin(xincp);
    double cosip = std::cos(xincp);

    // Long period terms depend on the perturbed inclination for deep space
    if (state.method == 'd') {
        aycof = -0.5 * J3OJ2 * sinip;
        double denominator = (std::abs(cosip + 1.0) > 1.5e-12) ? (1.0 + cosip) : 1.5e-12;
        xlcof = -0.25 * J3OJ2 * sinip * (3.0 + 5.0 * cosip) / denominator;
        double cosisq = cosip * cosip;
        con41 = 3.0 * cosisq - 1.0;
        x1mth2 = 1.0 - cosisq;
        x7thm1 = 7.0 * cosisq - 1.0;
    }

    double axnl = ep * std::cos(argpp);
    double temp = 1.0 / (am * (1.0 - ep * ep));
    double aynl = ep * std::sin(argpp) + temp * aycof;
    double xl = mp + argpp + nodep + temp * xlcof * axnl;

    // Solve Kepler's equation
    double u = std::fmod(xl - nodep, TWO_PI);
    double eo1 = u;
    double tem5 = 9999.9;
    double sineo1 = 0.0;
    double coseo1 = 0.0;

    for (int ktr = 1; std::abs(tem5) >= 1.0e-12 && ktr <= 10; ktr++) {
        sineo1 = std::sin(eo1);
        coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (std::abs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
    }

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);

    if (pl < 0.0) {
        throw InvalidOrbitException(SEMI_LATUS_RECTUM_NEGATIVE, "Semi-latus rectum is negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * J2 * temp;
    double temp2 = temp1 * temp;

    // Update for short period periodics
    double mrt = rl * (1.0 - 1.5 * temp2 * betal * con41) + 0.5 * temp1 * x1mth2 * cos2u;
    su = su - 0.25 * temp2 * x7thm1 * sin2u;
    double xnode = nodep + 1.5 * temp2 * cosip * sin2u;
    double xinc = xincp + 1.5 * temp2 * cosip * sinip * cos2u;
    double mvt = rdotl - nm * temp1 * x1mth2 * sin2u / XKE;
    double rvdot = rvdotl + nm * temp1 * (x1mth2 * cos2u + 1.5 * con41) / XKE;

    // Orientation vectors
    double sinsu = std::sin(su);
    double cossu = std::cos(su);
    double snod = std::sin(xnode);
    double cnod = std::cos(xnode);
    double sini = std::sin(xinc);
    double cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    double ux = xmx * sinsu + cnod * cossu;
    double uy = xmy * sinsu + snod * cossu;
    double uz = sini * sinsu;
    double vx = xmx * cossu - cnod * sinsu;
    double vy = xmy * cossu - snod * sinsu;
    double vz = sini * cossu;

    result.r[0] = mrt * ux * RADIUS_EARTH_KM;
    result.r[1] = mrt * uy * RADIUS_EARTH_KM;
    result.r[2] = mrt * uz * RADIUS_EARTH_KM;
    result.v[0] = (mvt * ux + rvdot * vx) * VKMPERSEC;
    result.v[1] = (mvt * uy + rvdot * vy) * VKMPERSEC;
    result.v[2] = (mvt * uz + rvdot * vz) * VKMPERSEC;

    if (mrt < 1.0) {
        throw SatelliteDecayedException();
    }

    return result;
}

} // namespace orbitcast::sgp4
