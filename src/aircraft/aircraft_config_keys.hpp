#pragma once

namespace aerobuild {
namespace ConfigKeys {

    // Identity
    inline constexpr char NAME[] = "name";

    // Mass properties
    inline constexpr char MASS[] = "mass";
    inline constexpr char IXX[] = "ixx";
    inline constexpr char IYY[] = "iyy";
    inline constexpr char IZZ[] = "izz";
    inline constexpr char IXZ[] = "ixz";

    // Geometry
    inline constexpr char WING_AREA[] = "wing_area";
    inline constexpr char WING_SPAN[] = "wing_span";
    inline constexpr char MAC[] = "mac";

    // Drag
    inline constexpr char C_D_0[] = "c_D_0";
    inline constexpr char C_D_ALPHA[] = "c_D_alpha";
    inline constexpr char C_D_ALPHA_Q[] = "c_D_alpha_q";
    inline constexpr char C_D_ALPHA_DELTAE[] = "c_D_alpha_deltae";
    inline constexpr char C_D_ALPHA2[] = "c_D_alpha2";
    inline constexpr char C_D_ALPHA2_Q[] = "c_D_alpha2_q";
    inline constexpr char C_D_ALPHA2_DELTAE[] = "c_D_alpha2_deltae";
    inline constexpr char C_D_ALPHA3[] = "c_D_alpha3";
    inline constexpr char C_D_ALPHA3_Q[] = "c_D_alpha3_q";
    inline constexpr char C_D_ALPHA4[] = "c_D_alpha4";

    // Side force
    inline constexpr char C_Y_BETA[] = "c_Y_beta";
    inline constexpr char C_Y_P[] = "c_Y_p";
    inline constexpr char C_Y_R[] = "c_Y_r";
    inline constexpr char C_Y_DELTAA[] = "c_Y_deltaa";
    inline constexpr char C_Y_DELTAR[] = "c_Y_deltar";

    // Lift
    inline constexpr char C_L_0[] = "c_L_0";
    inline constexpr char C_L_ALPHA[] = "c_L_alpha";
    inline constexpr char C_L_Q[] = "c_L_q";
    inline constexpr char C_L_DELTAE[] = "c_L_deltae";
    inline constexpr char C_L_ALPHA_Q[] = "c_L_alpha_q";
    inline constexpr char C_L_ALPHA2[] = "c_L_alpha2";
    inline constexpr char C_L_ALPHA3[] = "c_L_alpha3";
    inline constexpr char C_L_ALPHA4[] = "c_L_alpha4";

    // Roll
    inline constexpr char C_ROLL_BETA[] = "c_l_beta";
    inline constexpr char C_ROLL_P[] = "c_l_p";
    inline constexpr char C_ROLL_R[] = "c_l_r";
    inline constexpr char C_ROLL_DELTAA[] = "c_l_deltaa";
    inline constexpr char C_ROLL_DELTAR[] = "c_l_deltar";

    // Pitch
    inline constexpr char C_M_0[] = "c_m_0";
    inline constexpr char C_M_ALPHA[] = "c_m_alpha";
    inline constexpr char C_M_Q[] = "c_m_q";
    inline constexpr char C_M_DELTAE[] = "c_m_deltae";
    inline constexpr char C_M_ALPHA_Q[] = "c_m_alpha_q";
    inline constexpr char C_M_ALPHA2_Q[] = "c_m_alpha2_q";
    inline constexpr char C_M_ALPHA2_DELTAE[] = "c_m_alpha2_deltae";
    inline constexpr char C_M_ALPHA3_Q[] = "c_m_alpha3_q";
    inline constexpr char C_M_ALPHA3_DELTAE[] = "c_m_alpha3_deltae";
    inline constexpr char C_M_ALPHA4[] = "c_m_alpha4";

    // Yaw
    inline constexpr char C_N_BETA[] = "c_n_beta";
    inline constexpr char C_N_P[] = "c_n_p";
    inline constexpr char C_N_R[] = "c_n_r";
    inline constexpr char C_N_DELTAA[] = "c_n_deltaa";
    inline constexpr char C_N_DELTAR[] = "c_n_deltar";
    inline constexpr char C_N_BETA2[] = "c_n_beta2";
    inline constexpr char C_N_BETA3[] = "c_n_beta3";

} // namespace ConfigKeys
} // namespace aerobuild
