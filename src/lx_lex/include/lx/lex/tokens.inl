#ifndef PN
#define PN(...)
#endif

// id, text

PN(punctuation_marker, "")

PN(brace_l, "{")
PN(brace_r, "}")
PN(bracket_l, "[")
PN(bracket_r, "]")
PN(colon, ":")
PN(comma, ",")
PN(dollar, "$")
PN(par_l, "(")
PN(par_r, ")")
PN(period, ".")
PN(pound, "#")
PN(semi, ";")

#undef PN

#ifndef OP
#define OP(...)
#endif

// id, text

OP(operator_marker, "")

OP(amper, "&")
OP(amper_dbl, "&&")
OP(amper_eq, "&=")
OP(aster, "*")
OP(aster_eq, "*=")
OP(bar, "|")
OP(bar_dbl, "||")
OP(bar_eq, "|=")
OP(caret, "^")
OP(caret_eq, "^=")
OP(eq, "=")
OP(eq_dbl, "==")
OP(exclam, "!")
OP(exclam_eq, "!=")
OP(greater, ">")
OP(greater_dbl, ">>")
OP(greater_dbl_eq, ">>=")
OP(greater_eq, ">=")
OP(less, "<")
OP(less_dbl, "<<")
OP(less_dbl_eq, "<<=")
OP(less_eq, "<=")
OP(minus, "-")
OP(minus_eq, "-=")
OP(minus_greater, "->")
OP(percent, "%")
OP(percent_eq, "%=")
OP(plus, "+")
OP(plus_eq, "+=")
OP(question, "?")
OP(slash, "/")
OP(slash_eq, "/=")
OP(tilde, "~")

#undef OP

#ifndef KW
#define KW(...)
#endif

// id

KW(keyword_marker)

KW(break)
KW(continue)
KW(else)
KW(false)
KW(fn)
KW(for)
KW(if)
KW(let)
KW(return)
KW(struct)
KW(true)
KW(while)

#undef KW

#ifndef SP
#define SP(...)
#endif

// id, text

SP(id, "identifier")
SP(int_const, "integer literal")
SP(float_const, "float literal")

SP(invalid, "invalid character")
SP(eof, "end of file")

#undef SP
