#include <test.token/test.token.hpp>
using namespace std;

namespace btcred {

void test_token::issue(const name& to, const asset& quantity, const string& memo)
{
    require_auth(to);

    check(to == _g.issuer, "tokens can only be issued to issuer account");
    check(memo.size() <= 256, "memo has more than 256 bytes");
    check(quantity.is_valid(), "invalid quantity");
    check(quantity.amount > 0, "must issue positive quantity");
    check(quantity.symbol == _g.max_supply.symbol, "symbol precision mismatch");
    check(quantity.amount <= _g.max_supply.amount - _g.supply.amount, "quantity exceeds available supply");

    _g.supply += quantity;

    add_balance(_g.issuer, quantity, _g.issuer);
}

void test_token::transfer(const name& from, const name& to, const asset& quantity, const string& memo)
{
    require_auth(from);

    check( from != to, "cannot transfer to self" );
    check( is_account(to), "to account does not exist" );
    check( _g.supply.symbol == quantity.symbol, "symbol mismatch" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must transfer positive quantity" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );

    require_recipient( from );
    require_recipient( to );

    auto payer = has_auth(to) ? to : from;

    sub_balance(from, quantity);
    add_balance(to, quantity, payer);
}

void test_token::sub_balance(const name& owner, const asset& quant)
{
    accounts from_accts( get_self(), owner.value );
    const auto& from = from_accts.get( quant.symbol.code().raw(), "no balance object found" );
    check( from.balance >= quant, "overdrawn balance" );

    from_accts.modify(from, owner, [&](auto& a) {
        a.balance -= quant;
    });
}

void test_token::add_balance(const name& owner, const asset& quant, const name& ram_payer)
{
    accounts to_accts( get_self(), owner.value );
    auto to = to_accts.find( quant.symbol.code().raw() );
    if (to == to_accts.end()) {
        to_accts.emplace(ram_payer, [&](auto& a) {
            a.balance = quant;
        });
        return;
    }

    to_accts.modify(to, same_payer, [&](auto& a) {
        a.balance += quant;
    });
}

} /// namespace btcred
