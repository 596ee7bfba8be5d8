// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "teju_tables.h"

using namespace teju::impl;

//==================================================================================================
// ComputeScaledPow10
//==================================================================================================
// Constant data: 9872 bytes

const Uint64x2& teju::impl::ComputeScaledPow10(int f)
{
    static constexpr Uint64x2 ScaledPow10[MaxDecExp - MinDecExp + 1] = {
        {0x9E19DB92B4E31BA9, 0x6C07A2C26A8346D2}, // f = -324, e = -1076
        {0xFCF62C1DEE382C42, 0x46729E03DD9ED7B6}, // f = -323, e = -1072
        {0xCA5E89B18B602368, 0x385BB19CB14BDFC5}, // f = -322, e = -1069
        {0xA1E53AF46F801C53, 0x60495AE3C1097FD1}, // f = -321, e = -1066
        {0x81842F29F2CCE375, 0xE6A1158300D46641}, // f = -320, e = -1063
        {0xCF39E50FEAE16BEF, 0xD768226B34870A01}, // f = -319, e = -1059
        {0xA5C7EA73224DEFF3, 0x12B9B522906C0801}, // f = -318, e = -1056
        {0x849FEEC281D7F328, 0xDBC7C41BA6BCD334}, // f = -317, e = -1053
        {0xD433179D9C8CB841, 0x5FA60692A46151EC}, // f = -316, e = -1049
        {0xA9C2794AE3A3C69A, 0xB2EB3875504DDB23}, // f = -315, e = -1046
        {0x87CEC76F1C830548, 0x8F2293910D0B15B6}, // f = -314, e = -1043
        {0xD94AD8B1C7380874, 0x18375281AE7822BD}, // f = -313, e = -1039
        {0xADD57A27D29339F6, 0x79C5DB9AF1F9B564}, // f = -312, e = -1036
        {0x8B112E86420F6191, 0xFB04AFAF27FAF783}, // f = -311, e = -1033
        {0xDE81E40A034BCF4F, 0xF8077F7EA65E58D2}, // f = -310, e = -1029
        {0xB201833B35D63F73, 0x2CD2CC6551E513DB}, // f = -309, e = -1026
        {0x8E679C2F5E44FF8F, 0x570F09EAA7EA7649}, // f = -308, e = -1023
        {0xE3D8F9E563A198E5, 0x58180FDDD97723A7}, // f = -307, e = -1019
        {0xB6472E511C81471D, 0xE0133FE4ADF8E953}, // f = -306, e = -1016
        {0x91D28B7416CDD27E, 0x4CDC331D57FA5442}, // f = -305, e = -1013
        {0xE950DF20247C83FD, 0x47C6B82EF32A206A}, // f = -304, e = -1009
        {0xBAA718E68396CFFD, 0xD30560258F54E6BB}, // f = -303, e = -1006
        {0x95527A5202DF0CCB, 0x0F37801E0C43EBC9}, // f = -302, e = -1003
        {0xEEEA5D5004981478, 0x1858CCFCE06CAC75}, // f = -301, e =  -999
        {0xBF21E44003ACDD2C, 0xE0470A63E6BD56C4}, // f = -300, e =  -996
        {0x98E7E9CCCFBD7DBD, 0x8038D51CB897789D}, // f = -299, e =  -993
        {0xF4A642E14C6262C8, 0xCD27BB612758C0FB}, // f = -298, e =  -989
        {0xC3B8358109E84F07, 0x0A862F80EC4700C9}, // f = -297, e =  -986
        {0x9C935E00D4B9D8D2, 0x6ED1BF9A569F33D4}, // f = -296, e =  -983
        {0xFA856334878FC150, 0xB14F98F6F0FEB952}, // f = -295, e =  -979
        {0xC86AB5C39FA63440, 0x8DD9472BF3FEFAA8}, // f = -294, e =  -976
        {0xA0555E361951C366, 0xD7E105BCC3326220}, // f = -293, e =  -973
        {0x80444B5E7AA7CF85, 0x7980D163CF5B81B4}, // f = -292, e =  -970
        {0xCD3A1230C43FB26F, 0x28CE1BD2E55F35EC}, // f = -291, e =  -966
        {0xA42E74F3D032F525, 0xBA3E7CA8B77F5E56}, // f = -290, e =  -963
        {0x83585D8FD9C25DB7, 0xC831FD53C5FF7EAC}, // f = -289, e =  -960
        {0xD226FC195C6A2F8C, 0x73832EEC6FFF3112}, // f = -288, e =  -956
        {0xA81F301449EE8C70, 0x5C68F256BFFF5A75}, // f = -287, e =  -953
        {0x867F59A9D4BED6C0, 0x49ED8EABCCCC485E}, // f = -286, e =  -950
        {0xD732290FBACAF133, 0xA97C177947AD4096}, // f = -285, e =  -946
        {0xAC2820D9623BF429, 0x546345FA9FBDCD45}, // f = -284, e =  -943
        {0x89B9B3E11B6329BA, 0xA9E904C87FCB0A9E}, // f = -283, e =  -940
        {0xDC5C5301C56B75F7, 0x7641A140CC7810FC}, // f = -282, e =  -936
        {0xB049DC016ABC5E5F, 0x91CE1A9A3D2CDA63}, // f = -281, e =  -933
        {0x8D07E33455637EB2, 0xDB0B487B6423E1E9}, // f = -280, e =  -930
        {0xE1A63853BBD26451, 0x5E7873F8A0396974}, // f = -279, e =  -926
        {0xB484F9DC9641E9DA, 0xB1F9F660802DEDF7}, // f = -278, e =  -923
        {0x906A617D450187E2, 0x27FB2B80668B24C6}, // f = -277, e =  -920
        {0xE7109BFBA19C0C9D, 0x0CC512670A783AD5}, // f = -276, e =  -916
        {0xB8DA1662E7B00A17, 0x3D6A751F3B936244}, // f = -275, e =  -913
        {0x93E1AB8252F33B45, 0xCABB90E5C942B504}, // f = -274, e =  -910
        {0xEC9C459D51852BA2, 0xDDF8E7D60ED1219F}, // f = -273, e =  -906
        {0xBD49D14AA79DBC82, 0x4B2D8644D8A74E19}, // f = -272, e =  -903
        {0x976E41088617CA01, 0xD5BE0503E085D814}, // f = -271, e =  -900
        {0xF24A01A73CF2DCCF, 0xBC633B39673C8CED}, // f = -270, e =  -896
        {0xC1D4CE1F63F57D72, 0xFD1C2F611F63A3F1}, // f = -269, e =  -893
        {0x9B10A4E5E9913128, 0xCA7CF2B4191C8327}, // f = -268, e =  -890
        {0xF81AA16FDC1B81DA, 0xDD94B7868E94050B}, // f = -267, e =  -886
        {0xC67BB4597CE2CE48, 0xB143C6053EDCD0D6}, // f = -266, e =  -883
        {0x9EC95D1463E8A506, 0xF4363804324A40AB}, // f = -265, e =  -880
        {0xFE0EFB53D30DD4D7, 0xED238CD383AA0111}, // f = -264, e =  -876
        {0xCB3F2F7642717713, 0x241C70A936219A74}, // f = -263, e =  -873
        {0xA298F2C501F45F42, 0x8349F3BA91B47B90}, // f = -262, e =  -870
        {0x8213F56A67F6B29B, 0x9C3B29620E29FC74}, // f = -261, e =  -867
        {0xD01FEF10A657842C, 0x2D2B7569B0432D86}, // f = -260, e =  -863
        {0xA67FF273B8460356, 0x8A892ABAF368F138}, // f = -259, e =  -860
        {0x8533285C936B35DE, 0xD53A88958F872760}, // f = -258, e =  -857
        {0xD51EA6FA85785631, 0x552A74227F3EA566}, // f = -257, e =  -853
        {0xAA7EEBFB9DF9DE8D, 0xDDBB901B98FEEAB8}, // f = -256, e =  -850
        {0x8865899617FB1871, 0x7E2FA67C7A658893}, // f = -255, e =  -847
        {0xDA3C0F568CC4F3E8, 0xC9E5D72D90A2741F}, // f = -254, e =  -843
        {0xAE9672ABA3D0C320, 0xA184AC2473B529B2}, // f = -253, e =  -840
        {0x8BAB8EEFB6409C1A, 0x1AD089B6C2F7548F}, // f = -252, e =  -837
        {0xDF78E4B2BD342CF6, 0x914DA9246B255417}, // f = -251, e =  -833
        {0xB2C71D5BCA9023F8, 0x743E20E9EF511013}, // f = -250, e =  -830
        {0x8F05B1163BA6832D, 0x29CB4D87F2A7400F}, // f = -249, e =  -827
        {0xE4D5E82392A40515, 0x0FABAF3FEAA5334B}, // f = -248, e =  -823
        {0xB7118682DBB66A77, 0x3FBC8C33221DC2A2}, // f = -247, e =  -820
        {0x92746B9BE2F8552C, 0x32FD3CF5B4E49BB5}, // f = -246, e =  -817
        {0xEA53DF5FD18D5513, 0x84C86189216DC5EE}, // f = -245, e =  -813
        {0xBB764C4CA7A4440F, 0x9D6D1AD41ABE37F2}, // f = -244, e =  -810
        {0x95F83D0A1FB69CD9, 0x4ABDAF101564F98F}, // f = -243, e =  -807
        {0xEFF394DCFF8A948E, 0xDDFC4B4CEF07F5B1}, // f = -242, e =  -803
        {0xBFF610B0CC6EDD3F, 0x17FD090A58D32AF4}, // f = -241, e =  -800
        {0x9991A6F3D6BF1765, 0xACCA6DA1E0A8EF2A}, // f = -240, e =  -797
        {0xF5B5D7EC8ACB58A2, 0xAE10AF696774B1DC}, // f = -239, e =  -793
        {0xC491798A08A2AD4E, 0xF1A6F2BAB92A27E3}, // f = -238, e =  -790
        {0x9D412E0806E88AA5, 0x8E1F289560EE864F}, // f = -237, e =  -787
        {0xFB9B7CD9A4A7443C, 0x169840EF017DA3B2}, // f = -236, e =  -783
        {0xC94930AE1D529CFC, 0xDEE033F26797B628}, // f = -235, e =  -780
        {0xA1075A24E4421730, 0xB24CF65B8612F820}, // f = -234, e =  -777
        {0x80D2AE83E9CE78F3, 0xC1D72B7C6B42601A}, // f = -233, e =  -774
        {0xCE1DE40642E3F4B9, 0x36251260AB9D668F}, // f = -232, e =  -770
        {0xA4E4B66B68B65D60, 0xF81DA84D56178540}, // f = -231, e =  -767
        {0x83EA2B892091E44D, 0x934AED0AAB460433}, // f = -230, e =  -764
        {0xD31045A8341CA07C, 0x1EDE48111209A051}, // f = -229, e =  -760
        {0xA8D9D1535CE3B396, 0x7F1839A741A14D0E}, // f = -228, e =  -757
        {0x8714A775E3E95C78, 0x65ACFAEC34810A72}, // f = -227, e =  -754
        {0xD8210BEFD30EFA5A, 0x3C47F7E05401AA4F}, // f = -226, e =  -750
        {0xACE73CBFDC0BFB7B, 0x636CC64D1001550C}, // f = -225, e =  -747
        {0x8A5296FFE33CC92F, 0x82BD6B70D99AAA70}, // f = -224, e =  -744
        {0xDD50F1996B947518, 0xD12F124E28F7771A}, // f = -223, e =  -740
        {0xB10D8E1456105DAD, 0x7425A83E872C5F48}, // f = -222, e =  -737
        {0x8DA471A9DE737E24, 0x5CEAECFED289E5D3}, // f = -221, e =  -734
        {0xE2A0B5DC971F303A, 0x2E44AE64840FD61E}, // f = -220, e =  -730
        {0xB54D5E4A127F59C8, 0x2503BEB6D00CAB4C}, // f = -219, e =  -727
        {0x910AB1D4DB9914A0, 0x1D9C9892400A22A3}, // f = -218, e =  -724
        {0xE8111C87C5C1BA99, 0xC8FA8DB6CCDD0438}, // f = -217, e =  -720
        {0xB9A74A0637CE2EE1, 0x6D953E2BD7173693}, // f = -216, e =  -717
        {0x9485D4D1C63E8BE7, 0x8ADDCB5645AC2BA9}, // f = -215, e =  -714
        {0xEDA2EE1C7064130C, 0x1162DEF06F79DF74}, // f = -214, e =  -710
        {0xBE1BF1B059E9A8D6, 0x744F18C0592E4C5D}, // f = -213, e =  -707
        {0x98165AF37B2153DE, 0xC3727A337A8B704B}, // f = -212, e =  -704
        {0xF356F7EBF83552FE, 0x0583F6B8C4124D44}, // f = -211, e =  -700
        {0xC2ABF989935DDBFE, 0x6ACFF893D00EA436}, // f = -210, e =  -697
        {0x9BBCC7A142B17CCB, 0x88A66076400BB692}, // f = -209, e =  -694
        {0xF92E0C3537826145, 0xA7709A56CCDF8A83}, // f = -208, e =  -690
        {0xC75809C42C684DD1, 0x52C07B78A3E60869}, // f = -207, e =  -687
        {0x9F79A169BD203E41, 0x0F0062C6E984D387}, // f = -206, e =  -684
        {0xFF290242C83396CE, 0x7E67047175A15272}, // f = -205, e =  -680
        {0xCC20CE9BD35C78A5, 0x31EC038DF7B441F5}, // f = -204, e =  -677
        {0xA34D721642B06084, 0x27F002D7F95D0191}, // f = -203, e =  -674
        {0x82A45B450226B39C, 0xECC0024661173474}, // f = -202, e =  -671
        {0xD106F86E69D785C7, 0xE13336D701BEBA53}, // f = -201, e =  -667
        {0xA738C6BEBB12D16C, 0xB428F8AC016561DC}, // f = -200, e =  -664
        {0x85C7056562757456, 0xF6872D5667844E4A}, // f = -199, e =  -661
        {0xD60B3BD56A5586F1, 0x8A71E223D8D3B075}, // f = -198, e =  -657
        {0xAB3C2FDDEEAAD25A, 0xD527E81CAD7626C4}, // f = -197, e =  -654
        {0x88FCF317F22241E2, 0x441FECE3BDF81F04}, // f = -196, e =  -651
        {0xDB2E51BFE9D0696A, 0x06997B05FCC0319F}, // f = -195, e =  -647
        {0xAF58416654A6BABB, 0x387AC8D1970027B3}, // f = -194, e =  -644
        {0x8C469AB843B89562, 0x93956D7478CCEC8F}, // f = -193, e =  -641
        {0xE070F78D3927556A, 0x85BBE253F47B1418}, // f = -192, e =  -637
        {0xB38D92D760EC4455, 0x37C981DCC395A9AD}, // f = -191, e =  -634
        {0x8FA475791A569D10, 0xF96E017D694487BD}, // f = -190, e =  -631
        {0xE5D3EF282A242E81, 0x8F1668C8A86DA5FB}, // f = -189, e =  -627
        {0xB7DCBF5354E9BECE, 0x0C11ED6D538AEB30}, // f = -188, e =  -624
        {0x9316FF75DD87CBD8, 0x09A7F12442D588F3}, // f = -187, e =  -621
        {0xEB57FF22FC0C7959, 0xA90CB506D155A7EB}, // f = -186, e =  -617
        {0xBC4665B596706114, 0x873D5D9F0DDE1FEF}, // f = -185, e =  -614
        {0x969EB7C47859E743, 0x9F644AE5A4B1B326}, // f = -184, e =  -611
        {0xF0FDF2D3F3C30B9F, 0x656D44A2A11C51D6}, // f = -183, e =  -607
        {0xC0CB28A98FCF3C7F, 0x84576A1BB416A7DE}, // f = -182, e =  -604
        {0x9A3C2087A63F6399, 0x36AC54E2F678864C}, // f = -181, e =  -601
        {0xF6C69A72A3989F5B, 0x8AAD549E57273D46}, // f = -180, e =  -597
        {0xC56BAEC21C7A1916, 0x088AAA1845B8FDD1}, // f = -179, e =  -594
        {0x9DEFBF01B061ADAB, 0x3A0888136AFA64A8}, // f = -178, e =  -591
        {0xFCB2CB35E702AF78, 0x5CDA735244C3D43F}, // f = -177, e =  -587
        {0xCA28A291859BBF93, 0x7D7B8F7503CFDCFF}, // f = -176, e =  -584
        {0xA1BA1BA79E1632DC, 0x6462D92A69731733}, // f = -175, e =  -581
        {0x8161AFB94B44F57D, 0x1D1BE0EEBAC278F6}, // f = -174, e =  -578
        {0xCF02B2C21207EF2E, 0x94F967E45E03F4BC}, // f = -173, e =  -574
        {0xA59BC234DB398C25, 0x43FAB9837E699096}, // f = -172, e =  -571
        {0x847C9B5D7C2E09B7, 0x69956135FEBADA12}, // f = -171, e =  -568
        {0xD3FA922F2D1675F2, 0x42889B8997915CE9}, // f = -170, e =  -564
        {0xA99541BF57452B28, 0x353A1607AC744A54}, // f = -169, e =  -561
        {0x87AA9AFF79042286, 0x90FB44D2F05D0843}, // f = -168, e =  -558
        {0xD910F7FF28069DA4, 0x1B2BA1518094DA05}, // f = -167, e =  -554
        {0xADA72CCC20054AE9, 0xAF561AA79A10AE6B}, // f = -166, e =  -551
        {0x8AEC23D680043BEE, 0x25DE7BB9480D5855}, // f = -165, e =  -548
        {0xDE469FBD99A05FE3, 0x6FCA5F8ED9AEF3BC}, // f = -164, e =  -544
        {0xB1D219647AE6B31C, 0x596EB2D8AE258FC9}, // f = -163, e =  -541
        {0x8E41ADE9FBEBC27D, 0x14588F13BE847308}, // f = -162, e =  -538
        {0xE39C49765FDF9D94, 0xED5A7E85FDA0B80C}, // f = -161, e =  -534
        {0xB616A12B7FE617AA, 0x577B986B314D600A}, // f = -160, e =  -531
        {0x91ABB422CCB812EE, 0xAC62E055C10AB33B}, // f = -159, e =  -528
        {0xE912B9D1478CEB17, 0x7A37CD5601AAB85E}, // f = -158, e =  -524
        {0xBA756174393D88DF, 0x94F971119AEEF9E5}, // f = -157, e =  -521
        {0x952AB45CFA97A0B2, 0xDD945A747BF26184}, // f = -156, e =  -518
        {0xEEAABA2E5DBF6784, 0x95BA2A53F983CF39}, // f = -155, e =  -514
        {0xBEEEFB584AFF8603, 0xAAFB550FFACFD8FB}, // f = -154, e =  -511
        {0x98BF2F79D5993802, 0xEF2F773FFBD97A62}, // f = -153, e =  -508
        {0xF46518C2EF5B8CD1, 0x7EB258665FC25D6A}, // f = -152, e =  -504
        {0xC38413CF25E2D70D, 0xFEF5138519684ABB}, // f = -151, e =  -501
        {0x9C69A97284B578D7, 0xFF2A760414536EFC}, // f = -150, e =  -498
        {0xFA42A8B73ABBF48C, 0xCB772339BA1F17FA}, // f = -149, e =  -494
        {0xC83553C5C8965D3D, 0x6F92829494E5ACC8}, // f = -148, e =  -491
        {0xA02AA96B06DEB0FD, 0xF2DB9BAA10B7BD6D}, // f = -147, e =  -488
        {0x802221226BE55A64, 0xC2494954DA2C978A}, // f = -146, e =  -485
        {0xCD036837130890A1, 0x36DBA887C37A8C10}, // f = -145, e =  -481
        {0xA402B9C5A8D3A6E7, 0x5F16206C9C6209A7}, // f = -144, e =  -478
        {0x8335616AED761F1F, 0x7F44E6BD49E807B9}, // f = -143, e =  -475
        {0xD1EF0244AF2364FF, 0x3207D795430CD927}, // f = -142, e =  -471
        {0xA7F26836F282B732, 0x8E6CAC7768D7141F}, // f = -141, e =  -468
        {0x865B86925B9BC5C2, 0x0B8A2392BA45A9B3}, // f = -140, e =  -465
        {0xD6F8D7509292D603, 0x45A9D2845D3C42B7}, // f = -139, e =  -461
        {0xABFA45DA0EDBDE69, 0x0487DB9D17636893}, // f = -138, e =  -458
        {0x899504AE72497EBA, 0x6A06494A791C53A9}, // f = -137, e =  -455
        {0xDC21A1171D42645D, 0x76707543F4FA1F74}, // f = -136, e =  -451
        {0xB01AE745B101E9E4, 0x5EC05DCFF72E7F90}, // f = -135, e =  -448
        {0x8CE2529E2734BB1D, 0x1899E4A65F58660D}, // f = -134, e =  -445
        {0xE16A1DC9D8545E94, 0xF4296DD6FEF3D67B}, // f = -133, e =  -441
        {0xB454E4A179DD1877, 0x29BABE4598C311FC}, // f = -132, e =  -438
        {0x9043EA1AC7E41392, 0x87C89837AD68DB30}, // f = -131, e =  -435
        {0xE6D3102AD96CEC1D, 0xA60DC059157491E6}, // f = -130, e =  -431
        {0xB8A8D9BBE123F017, 0xB80B0047445D4185}, // f = -129, e =  -428
        {0x93BA47C980E98CDF, 0xC66F336C36B10138}, // f = -128, e =  -425
        {0xEC5D3FA8CE427AFF, 0xA3E51F138AB4CEBF}, // f = -127, e =  -421
        {0xBD176620A501FBFF, 0xB650E5A93BC3D899}, // f = -126, e =  -418
        {0x9745EB4D50CE6332, 0xF840B7BA963646E1}, // f = -125, e =  -415
        {0xF209787BB47D6B84, 0xC0678C5DBD23A49B}, // f = -124, e =  -411
        {0xC1A12D2FC3978937, 0x0052D6B1641C83AF}, // f = -123, e =  -408
        {0x9AE757596946075F, 0x3375788DE9B06959}, // f = -122, e =  -405
        {0xF7D88BC24209A565, 0x1F225A7CA91A4227}, // f = -121, e =  -401
        {0xC646D63501A1511D, 0xB281E1FD541501B9}, // f = -120, e =  -398
        {0x9E9F11C4014DDA7E, 0x2867E7FDDCDD9AFB}, // f = -119, e =  -395
        {0xFDCB4FA002162A63, 0x73D9732FC7C8F7F7}, // f = -118, e =  -391
        {0xCB090C8001AB551C, 0x5CADF5BFD3072CC6}, // f = -117, e =  -388
        {0xA26DA3999AEF7749, 0xE3BE5E330F38F09E}, // f = -116, e =  -385
        {0x81F14FAE158C5F6E, 0x4FCB7E8F3F60C07F}, // f = -115, e =  -382
        {0xCFE87F7CEF46FF16, 0xE612641865679A64}, // f = -114, e =  -378
        {0xA6539930BF6BFF45, 0x84DB8346B786151D}, // f = -113, e =  -375
        {0x850FADC09923329E, 0x03E2CF6BC604DDB1}, // f = -112, e =  -372
        {0xD4E5E2CDC1D1EA96, 0x6C9E18AC7007C91B}, // f = -111, e =  -368
        {0xAA51823E34A7EEDE, 0xBD4B46F0599FD416}, // f = -110, e =  -365
        {0x884134FE908658B2, 0x3109058D147FDCDE}, // f = -109, e =  -362
        {0xDA01EE641A708DE9, 0xE80E6F4820CC9496}, // f = -108, e =  -358
        {0xAE67F1E9AEC07187, 0xECD8590680A3AA12}, // f = -107, e =  -355
        {0x8B865B215899F46C, 0xBD79E0D20082EE75}, // f = -106, e =  -352
        {0xDF3D5E9BC0F653E1, 0x2F2967B66737E3EE}, // f = -105, e =  -348
        {0xB2977EE300C50FE7, 0x58EDEC91EC2CB658}, // f = -104, e =  -345
        {0x8EDF98B59A373FEC, 0x4724BD4189BD5EAD}, // f = -103, e =  -342
        {0xE498F455C38B997A, 0x0B6DFB9C0F956448}, // f = -102, e =  -338
        {0xB6E0C377CFA2E12E, 0x6F8B2FB00C77836D}, // f = -101, e =  -335
        {0x924D692CA61BE758, 0x593C2626705F9C57}, // f = -100, e =  -332
        {0xEA1575143CF97226, 0xF52D09D71A3293BE}, // f =  -99, e =  -328
        {0xBB445DA9CA61281F, 0x2A8A6E45AE8EDC98}, // f =  -98, e =  -325
        {0x95D04AEE3B80ECE5, 0xBBA1F1D158724A13}, // f =  -97, e =  -322
        {0xEFB3AB16C59B14A2, 0xC5CFE94EF3EA101F}, // f =  -96, e =  -318
        {0xBFC2EF456AE276E8, 0x9E3FEDD8C321A67F}, // f =  -95, e =  -315
        {0x9968BF6ABBE85F20, 0x7E998B13CF4E1ECC}, // f =  -94, e =  -312
        {0xF5746577930D6500, 0xCA8F44EC7EE3647A}, // f =  -93, e =  -308
        {0xC45D1DF942711D9A, 0x3BA5D0BD324F8395}, // f =  -92, e =  -305
        {0x9D174B2DCEC0E47B, 0x62EB0D64283F9C77}, // f =  -91, e =  -302
        {0xFB5878494ACE3A5F, 0x04AB48A04065C724}, // f =  -90, e =  -298
        {0xC913936DD571C84C, 0x03BC3A19CD1E38EA}, // f =  -89, e =  -295
        {0xA0DC75F1778E39D6, 0x696361AE3DB1C722}, // f =  -88, e =  -292
        {0x80B05E5AC60B6178, 0x544F8158315B05B5}, // f =  -87, e =  -289
        {0xCDE6FD5E09ABCF26, 0xED4C0226B55E6F87}, // f =  -86, e =  -285
        {0xA4B8CAB1A1563F52, 0x577001B891185939}, // f =  -85, e =  -282
        {0x83C7088E1AAB65DB, 0x792667C6DA79E0FB}, // f =  -84, e =  -279
        {0xD2D80DB02AABD62B, 0xF50A3FA490C30191}, // f =  -83, e =  -275
        {0xA8ACD7C0222311BC, 0xC40832EA0D68CE0D}, // f =  -82, e =  -272
        {0x86F0AC99B4E8DAFD, 0x69A028BB3DED71A4}, // f =  -81, e =  -269
        {0xD7E77A8F87DAF7FB, 0xDC33745EC97BE907}, // f =  -80, e =  -265
        {0xACB92ED9397BF996, 0x49C2C37F07965405}, // f =  -79, e =  -262
        {0x8A2DBF142DFCC7AB, 0x6E3569326C784338}, // f =  -78, e =  -259
        {0xDD15FE86AFFAD912, 0x49EF0EB713F39EBF}, // f =  -77, e =  -255
        {0xB0DE65388CC8ADA8, 0x3B25A55F43294BCC}, // f =  -76, e =  -252
        {0x8D7EB76070A08AEC, 0xFC1E1DE5CF543CA3}, // f =  -75, e =  -249
        {0xE264589A4DCDAB14, 0xC696963C7EED2DD2}, // f =  -74, e =  -245
        {0xB51D13AEA4A488DD, 0x6BABAB6398BDBE42}, // f =  -73, e =  -242
        {0x90E40FBEEA1D3A4A, 0xBC8955E946FE31CE}, // f =  -72, e =  -239
        {0xE7D34C64A9C85D44, 0x60DBBCA87196B617}, // f =  -71, e =  -235
        {0xB975D6B6EE39E436, 0xB3E2FD538E122B45}, // f =  -70, e =  -232
        {0x945E455F24FB1CF8, 0x8FE8CAA93E74EF6B}, // f =  -69, e =  -229
        {0xED63A231D4C4FB27, 0x4CA7AAA863EE4BDE}, // f =  -68, e =  -225
        {0xBDE94E8E43D0C8EC, 0x3D52EEED1CBEA318}, // f =  -67, e =  -222
        {0x97EDD871CFDA3A56, 0x97758BF0E3CBB5AD}, // f =  -66, e =  -219
        {0xF316271C7FC3908A, 0x8BEF464E3945EF7B}, // f =  -65, e =  -215
        {0xC2781F49FFCFA6D5, 0x3CBF6B71C76B25FC}, // f =  -64, e =  -212
        {0x9B934C3B330C8577, 0x63CC55F49F88EB30}, // f =  -63, e =  -209
        {0xF8EBAD2B84E0D58B, 0xD2E0898765A7DEB3}, // f =  -62, e =  -205
        {0xC722F0EF9D80AAD6, 0x424D3AD2B7B97EF6}, // f =  -61, e =  -202
        {0x9F4F2726179A2245, 0x01D762422C946591}, // f =  -60, e =  -199
        {0xFEE50B7025C36A08, 0x02F236D04753D5B5}, // f =  -59, e =  -195
        {0xCBEA6F8CEB02BB39, 0x9BF4F8A69F764491}, // f =  -58, e =  -192
        {0xA321F2D7226895C7, 0xAFF72D52192B6A0E}, // f =  -57, e =  -189
        {0x82818F1281ED449F, 0xBFF8F10E7A8921A5}, // f =  -56, e =  -186
        {0xD0CF4B50CFE20765, 0xFFF4B4E3F741CF6D}, // f =  -55, e =  -182
        {0xA70C3C40A64E6C51, 0x999090B65F67D924}, // f =  -54, e =  -179
        {0x85A36366EB71F041, 0x47A6DA2B7F864750}, // f =  -53, e =  -176
        {0xD5D238A4ABE98068, 0x72A4904598D6D880}, // f =  -52, e =  -172
        {0xAB0E93B6EFEE0053, 0x8EEA0D047A457A00}, // f =  -51, e =  -169
        {0x88D8762BF324CD0F, 0xA5880A69FB6AC800}, // f =  -50, e =  -166
        {0xDAF3F04651D47B4C, 0x3C0CDD765F114000}, // f =  -49, e =  -162
        {0xAF298D050E4395D6, 0x9670B12B7F410000}, // f =  -48, e =  -159
        {0x8C213D9DA502DE45, 0x4526F422CC340000}, // f =  -47, e =  -156
        {0xE0352F62A19E306E, 0xD50B2037AD200000}, // f =  -46, e =  -152
        {0xB35DBF821AE4F38B, 0xDDA2802C8A800000}, // f =  -45, e =  -149
        {0x8F7E32CE7BEA5C6F, 0xE4820023A2000000}, // f =  -44, e =  -146
        {0xE596B7B0C643C719, 0x6D9CCD05D0000000}, // f =  -43, e =  -142
        {0xB7ABC627050305AD, 0xF14A3D9E40000000}, // f =  -42, e =  -139
        {0x92EFD1B8D0CF37BE, 0x5AA1CAE500000000}, // f =  -41, e =  -136
        {0xEB194F8E1AE525FD, 0x5DCFAB0800000000}, // f =  -40, e =  -132
        {0xBC143FA4E250EB31, 0x17D955A000000000}, // f =  -39, e =  -129
        {0x96769950B50D88F4, 0x1314448000000000}, // f =  -38, e =  -126
        {0xF0BDC21ABB48DB20, 0x1E86D40000000000}, // f =  -37, e =  -122
        {0xC097CE7BC90715B3, 0x4B9F100000000000}, // f =  -36, e =  -119
        {0x9A130B963A6C115C, 0x3C7F400000000000}, // f =  -35, e =  -116
        {0xF684DF56C3E01BC6, 0xC732000000000000}, // f =  -34, e =  -112
        {0xC5371912364CE305, 0x6C28000000000000}, // f =  -33, e =  -109
        {0x9DC5ADA82B70B59D, 0xF020000000000000}, // f =  -32, e =  -106
        {0xFC6F7C4045812296, 0x4D00000000000000}, // f =  -31, e =  -102
        {0xC9F2C9CD04674EDE, 0xA400000000000000}, // f =  -30, e =   -99
        {0xA18F07D736B90BE5, 0x5000000000000000}, // f =  -29, e =   -96
        {0x813F3978F8940984, 0x4000000000000000}, // f =  -28, e =   -93
        {0xCECB8F27F4200F3A, 0x0000000000000000}, // f =  -27, e =   -89
        {0xA56FA5B99019A5C8, 0x0000000000000000}, // f =  -26, e =   -86
        {0x84595161401484A0, 0x0000000000000000}, // f =  -25, e =   -83
        {0xD3C21BCECCEDA100, 0x0000000000000000}, // f =  -24, e =   -79
        {0xA968163F0A57B400, 0x0000000000000000}, // f =  -23, e =   -76
        {0x878678326EAC9000, 0x0000000000000000}, // f =  -22, e =   -73
        {0xD8D726B7177A8000, 0x0000000000000000}, // f =  -21, e =   -69
        {0xAD78EBC5AC620000, 0x0000000000000000}, // f =  -20, e =   -66
        {0x8AC7230489E80000, 0x0000000000000000}, // f =  -19, e =   -63
        {0xDE0B6B3A76400000, 0x0000000000000000}, // f =  -18, e =   -59
        {0xB1A2BC2EC5000000, 0x0000000000000000}, // f =  -17, e =   -56
        {0x8E1BC9BF04000000, 0x0000000000000000}, // f =  -16, e =   -53
        {0xE35FA931A0000000, 0x0000000000000000}, // f =  -15, e =   -49
        {0xB5E620F480000000, 0x0000000000000000}, // f =  -14, e =   -46
        {0x9184E72A00000000, 0x0000000000000000}, // f =  -13, e =   -43
        {0xE8D4A51000000000, 0x0000000000000000}, // f =  -12, e =   -39
        {0xBA43B74000000000, 0x0000000000000000}, // f =  -11, e =   -36
        {0x9502F90000000000, 0x0000000000000000}, // f =  -10, e =   -33
        {0xEE6B280000000000, 0x0000000000000000}, // f =   -9, e =   -29
        {0xBEBC200000000000, 0x0000000000000000}, // f =   -8, e =   -26
        {0x9896800000000000, 0x0000000000000000}, // f =   -7, e =   -23
        {0xF424000000000000, 0x0000000000000000}, // f =   -6, e =   -19
        {0xC350000000000000, 0x0000000000000000}, // f =   -5, e =   -16
        {0x9C40000000000000, 0x0000000000000000}, // f =   -4, e =   -13
        {0xFA00000000000000, 0x0000000000000000}, // f =   -3, e =    -9
        {0xC800000000000000, 0x0000000000000000}, // f =   -2, e =    -6
        {0xA000000000000000, 0x0000000000000000}, // f =   -1, e =    -3
        {0x8000000000000000, 0x0000000000000000}, // f =    0, e =     0
        {0xCCCCCCCCCCCCCCCC, 0xCCCCCCCCCCCCCCCD}, // f =    1, e =     4
        {0xA3D70A3D70A3D70A, 0x3D70A3D70A3D70A4}, // f =    2, e =     7
        {0x83126E978D4FDF3B, 0x645A1CAC083126EA}, // f =    3, e =    10
        {0xD1B71758E219652B, 0xD3C36113404EA4A9}, // f =    4, e =    14
        {0xA7C5AC471B478423, 0x0FCF80DC33721D54}, // f =    5, e =    17
        {0x8637BD05AF6C69B5, 0xA63F9A49C2C1B110}, // f =    6, e =    20
        {0xD6BF94D5E57A42BC, 0x3D32907604691B4D}, // f =    7, e =    24
        {0xABCC77118461CEFC, 0xFDC20D2B36BA7C3E}, // f =    8, e =    27
        {0x89705F4136B4A597, 0x31680A88F8953031}, // f =    9, e =    30
        {0xDBE6FECEBDEDD5BE, 0xB573440E5A884D1C}, // f =   10, e =    34
        {0xAFEBFF0BCB24AAFE, 0xF78F69A51539D749}, // f =   11, e =    37
        {0x8CBCCC096F5088CB, 0xF93F87B7442E45D4}, // f =   12, e =    40
        {0xE12E13424BB40E13, 0x2865A5F206B06FBA}, // f =   13, e =    44
        {0xB424DC35095CD80F, 0x538484C19EF38C95}, // f =   14, e =    47
        {0x901D7CF73AB0ACD9, 0x0F9D37014BF60A11}, // f =   15, e =    50
        {0xE69594BEC44DE15B, 0x4C2EBE687989A9B4}, // f =   16, e =    54
        {0xB877AA3236A4B449, 0x09BEFEB9FAD487C3}, // f =   17, e =    57
        {0x9392EE8E921D5D07, 0x3AFF322E62439FD0}, // f =   18, e =    60
        {0xEC1E4A7DB69561A5, 0x2B31E9E3D06C32E6}, // f =   19, e =    64
        {0xBCE5086492111AEA, 0x88F4BB1CA6BCF585}, // f =   20, e =    67
        {0x971DA05074DA7BEE, 0xD3F6FC16EBCA5E04}, // f =   21, e =    70
        {0xF1C90080BAF72CB1, 0x5324C68B12DD6339}, // f =   22, e =    74
        {0xC16D9A0095928A27, 0x75B7053C0F178294}, // f =   23, e =    77
        {0x9ABE14CD44753B52, 0xC4926A9672793543}, // f =   24, e =    80
        {0xF79687AED3EEC551, 0x3A83DDBD83F52205}, // f =   25, e =    84
        {0xC612062576589DDA, 0x95364AFE032A819E}, // f =   26, e =    87
        {0x9E74D1B791E07E48, 0x775EA264CF55347E}, // f =   27, e =    90
        {0xFD87B5F28300CA0D, 0x8BCA9D6E188853FD}, // f =   28, e =    94
        {0xCAD2F7F5359A3B3E, 0x096EE45813A04331}, // f =   29, e =    97
        {0xA2425FF75E14FC31, 0xA1258379A94D028E}, // f =   30, e =   100
        {0x81CEB32C4B43FCF4, 0x80EACF948770CED8}, // f =   31, e =   103
        {0xCFB11EAD453994BA, 0x67DE18EDA5814AF3}, // f =   32, e =   107
        {0xA6274BBDD0FADD61, 0xECB1AD8AEACDD58F}, // f =   33, e =   110
        {0x84EC3C97DA624AB4, 0xBD5AF13BEF0B113F}, // f =   34, e =   113
        {0xD4AD2DBFC3D07787, 0x955E4EC64B44E865}, // f =   35, e =   117
        {0xAA242499697392D2, 0xDDE50BD1D5D0B9EA}, // f =   36, e =   120
        {0x881CEA14545C7575, 0x7E50D64177DA2E55}, // f =   37, e =   123
        {0xD9C7DCED53C72255, 0x96E7BD358C904A22}, // f =   38, e =   127
        {0xAE397D8AA96C1B77, 0xABEC975E0A0D081B}, // f =   39, e =   130
        {0x8B61313BBABCE2C6, 0x2323AC4B3B3DA016}, // f =   40, e =   133
        {0xDF01E85F912E37A3, 0x6B6C46DEC52F6689}, // f =   41, e =   137
        {0xB267ED1940F1C61C, 0x55F038B237591ED4}, // f =   42, e =   140
        {0x8EB98A7A9A5B04E3, 0x77F3608E92ADB243}, // f =   43, e =   143
        {0xE45C10C42A2B3B05, 0x8CB89A7DB77C506B}, // f =   44, e =   147
        {0xB6B00D69BB55C8D1, 0x3D607B97C5FD0D23}, // f =   45, e =   150
        {0x9226712162AB070D, 0xCAB3961304CA70E9}, // f =   46, e =   153
        {0xE9D71B689DDE71AF, 0xAAB8F01E6E10B4A7}, // f =   47, e =   157
        {0xBB127C53B17EC159, 0x5560C018580D5D53}, // f =   48, e =   160
        {0x95A8637627989AAD, 0xDDE7001379A44AA9}, // f =   49, e =   163
        {0xEF73D256A5C0F77C, 0x963E66858F6D4441}, // f =   50, e =   167
        {0xBF8FDB78849A5F96, 0xDE98520472BDD034}, // f =   51, e =   170
        {0x993FE2C6D07B7FAB, 0xE546A8038EFE402A}, // f =   52, e =   173
        {0xF53304714D9265DF, 0xD53DD99F4B3066A9}, // f =   53, e =   177
        {0xC428D05AA4751E4C, 0xAA97E14C3C26B887}, // f =   54, e =   180
        {0x9CED737BB6C4183D, 0x55464DD69685606C}, // f =   55, e =   183
        {0xFB158592BE068D2E, 0xEED6E2F0F0D56713}, // f =   56, e =   187
        {0xC8DE047564D20A8B, 0xF245825A5A445276}, // f =   57, e =   190
        {0xA0B19D2AB70E6ED6, 0x5B6ACEAEAE9D0EC5}, // f =   58, e =   193
        {0x808E17555F3EBF11, 0xE2BBD88BBEE40BD1}, // f =   59, e =   196
        {0xCDB02555653131B6, 0x3792F412CB06794E}, // f =   60, e =   200
        {0xA48CEAAAB75A8E2B, 0x5FA8C3423C052DD8}, // f =   61, e =   203
        {0x83A3EEEEF9153E89, 0x1953CF68300424AD}, // f =   62, e =   206
        {0xD29FE4B18E88640E, 0x8EEC7F0D19A03AAE}, // f =   63, e =   210
        {0xA87FEA27A539E9A5, 0x3F2398D747B36225}, // f =   64, e =   213
        {0x86CCBB52EA94BAEA, 0x98E947129FC2B4EA}, // f =   65, e =   216
        {0xD7ADF884AA879177, 0x5B0ED81DCC6ABB10}, // f =   66, e =   220
        {0xAC8B2D36EED2DAC5, 0xE272467E3D222F40}, // f =   67, e =   223
        {0x8A08F0F8BF0F156B, 0x1B8E9ECB641B5900}, // f =   68, e =   226
        {0xDCDB1B2798182244, 0xF8E431456CF88E66}, // f =   69, e =   230
        {0xB0AF48EC79ACE837, 0x2D835A9DF0C6D852}, // f =   70, e =   233
        {0x8D590723948A535F, 0x579C487E5A38AD0F}, // f =   71, e =   236
        {0xE2280B6C20DD5232, 0x25C6DA63C38DE1B1}, // f =   72, e =   240
        {0xB4ECD5F01A4AA828, 0x1E38AEB6360B1AF4}, // f =   73, e =   243
        {0x90BD77F3483BB9B9, 0xB1C6F22B5E6F48C3}, // f =   74, e =   246
        {0xE7958CB87392C2C2, 0xB60B1D1230B20E05}, // f =   75, e =   250
        {0xB94470938FA89BCE, 0xF808E40E8D5B3E6A}, // f =   76, e =   253
        {0x9436C0760C86E30B, 0xF9A0B6720AAF6522}, // f =   77, e =   256
        {0xED246723473E3813, 0x290123E9AAB23B69}, // f =   78, e =   260
        {0xBDB6B8E905CB600F, 0x5400E987BBC1C921}, // f =   79, e =   263
        {0x97C560BA6B0919A5, 0xDCCD879FC967D41B}, // f =   80, e =   266
        {0xF2D56790AB41C2A2, 0xFAE27299423FB9C4}, // f =   81, e =   270
        {0xC24452DA229B021B, 0xFBE85BADCE996169}, // f =   82, e =   273
        {0x9B69DBE1B548CE7C, 0xC986AFBE3EE11ABB}, // f =   83, e =   276
        {0xF8A95FCF88747D94, 0x75A44C6397CE912B}, // f =   84, e =   280
        {0xC6EDE63FA05D3143, 0x91503D1C79720DBC}, // f =   85, e =   283
        {0x9F24B832E6B0F436, 0x0DD9CA7D2DF4D7CA}, // f =   86, e =   286
        {0xFEA126B7D78186BC, 0xE2F610C84987BFA9}, // f =   87, e =   290
        {0xCBB41EF979346BCA, 0x4F2B40A03AD2FFBA}, // f =   88, e =   293
        {0xA2F67F2DFA90563B, 0x728900802F0F32FB}, // f =   89, e =   296
        {0x825ECC24C873782F, 0x8ED400668C0C28C9}, // f =   90, e =   299
        {0xD097AD07A71F26B2, 0x7E2000A41346A7A8}, // f =   91, e =   303
        {0xA6DFBD9FB8E5B88E, 0xCB4CCD500F6BB953}, // f =   92, e =   306
        {0x857FCAE62D8493A5, 0x6F70A4400C562DDC}, // f =   93, e =   309
        {0xD59944A37C0752A2, 0x4BE76D3346F04960}, // f =   94, e =   313
        {0xAAE103B5FCD2A881, 0xD652BDC29F26A11A}, // f =   95, e =   316
        {0x88B402F7FD75539B, 0x11DBCB0218EBB415}, // f =   96, e =   319
        {0xDAB99E59958885C4, 0xE95FAB368E45ECEE}, // f =   97, e =   323
        {0xAEFAE51477A06B03, 0xEDE622920B6B23F2}, // f =   98, e =   326
        {0x8BFBEA76C619EF36, 0x57EB4EDB3C55B65B}, // f =   99, e =   329
        {0xDFF9772470297EBD, 0x59787E2B93BC56F8}, // f =  100, e =   333
        {0xB32DF8E9F3546564, 0x47939822DC96ABFA}, // f =  101, e =   336
        {0x8F57FA54C2A9EAB6, 0x9FA946824A12232E}, // f =  102, e =   339
        {0xE55990879DDCAABD, 0xCC420A6A101D0516}, // f =  103, e =   343
        {0xB77ADA0617E3BBCB, 0x09CE6EBB40173745}, // f =  104, e =   346
        {0x92C8AE6B464FC96F, 0x3B0B8BC90012929E}, // f =  105, e =   349
        {0xEADAB0ABA3B2DBE5, 0x2B45AC74CCEA842F}, // f =  106, e =   353
        {0xBBE226EFB628AFEA, 0x890489F70A55368C}, // f =  107, e =   356
        {0x964E858C91BA2655, 0x3A6A07F8D510F870}, // f =  108, e =   359
        {0xF07DA27A82C37088, 0x5D767327BB4E5A4D}, // f =  109, e =   363
        {0xC06481FB9BCF8D39, 0xE45EC2862F71E1D7}, // f =  110, e =   366
        {0x99EA0196163FA42E, 0x504BCED1BF8E4E46}, // f =  111, e =   369
        {0xF64335BCF065D37D, 0x4D4617B5FF4A16D6}, // f =  112, e =   373
        {0xC5029163F384A931, 0x0A9E795E65D4DF12}, // f =  113, e =   376
        {0x9D9BA7832936EDC0, 0xD54B944B84AA4C0E}, // f =  114, e =   379
        {0xFC2C3F3841F17C67, 0xBBAC2078D443ACE3}, // f =  115, e =   383
        {0xC9BCFF6034C13052, 0xFC89B393DD02F0B6}, // f =  116, e =   386
        {0xA163FF802A3426A8, 0xCA07C2DCB0CF26F8}, // f =  117, e =   389
        {0x811CCC668829B887, 0x0806357D5A3F5260}, // f =  118, e =   392
        {0xCE947A3DA6A9273E, 0x733D226229FEEA33}, // f =  119, e =   396
        {0xA54394FE1EEDB8FE, 0xC2974EB4EE658829}, // f =  120, e =   399
        {0x843610CB4BF160CB, 0xCEDF722A585139BB}, // f =  121, e =   402
        {0xD389B47879823479, 0x4AFF1D108D4EC2C4}, // f =  122, e =   406
        {0xA93AF6C6C79B5D2D, 0xD598E40D3DD89BD0}, // f =  123, e =   409
        {0x87625F056C7C4A8B, 0x11471CD764AD4973}, // f =  124, e =   412
        {0xD89D64D57A607744, 0xE871C7BF077BA8B8}, // f =  125, e =   416
        {0xAD4AB7112EB3929D, 0x86C16C98D2C953C7}, // f =  126, e =   419
        {0x8AA22C0DBEF60EE4, 0x6BCDF07A423AA96C}, // f =  127, e =   422
        {0xDDD0467C64BCE4A0, 0xAC7CB3F6D05DDBDF}, // f =  128, e =   426
        {0xB1736B96B6FD83B3, 0xBD308FF8A6B17CB3}, // f =  129, e =   429
        {0x8DF5EFABC5979C8F, 0xCA8D3FFA1EF463C2}, // f =  130, e =   432
        {0xE3231912D5BF60E6, 0x10E1FFF697ED6C6A}, // f =  131, e =   436
        {0xB5B5ADA8AAFF80B8, 0x0D819992132456BB}, // f =  132, e =   439
        {0x915E2486EF32CD60, 0x0ACE1474DC1D122F}, // f =  133, e =   442
        {0xE896A0D7E51E1566, 0x77B020BAF9C81D18}, // f =  134, e =   446
        {0xBA121A4650E4DDEB, 0x92F34D62616CE414}, // f =  135, e =   449
        {0x94DB483840B717EF, 0xA8C2A44EB4571CDD}, // f =  136, e =   452
        {0xEE2BA6C0678B597F, 0x746AA07DED582E2D}, // f =  137, e =   456
        {0xBE89523386091465, 0xF6BBB397F1135824}, // f =  138, e =   459
        {0x986DDB5C6B3A76B7, 0xF89629465A75E01D}, // f =  139, e =   462
        {0xF3E2F893DEC3F126, 0x5A89DBA3C3EFCCFB}, // f =  140, e =   466
        {0xC31BFA0FE5698DB8, 0x486E494FCFF30A63}, // f =  141, e =   469
        {0x9C1661A651213E2D, 0x06BEA10CA65C084F}, // f =  142, e =   472
        {0xF9BD690A1B68637B, 0x3DFDCE7AA3C673B1}, // f =  143, e =   476
        {0xC7CABA6E7C5382C8, 0xFE64A52EE96B8FC1}, // f =  144, e =   479
        {0x9FD561F1FD0F9BD3, 0xFEB6EA8BEDEFA634}, // f =  145, e =   482
        {0xFFBBCFE994E5C61F, 0xFDF17746497F7053}, // f =  146, e =   486
        {0xCC963FEE10B7D1B3, 0x318DF905079926A9}, // f =  147, e =   489
        {0xA3AB66580D5FDAF5, 0xC13E60D0D2E0EBBB}, // f =  148, e =   492
        {0x82EF85133DE648C4, 0x9A984D73DBE722FC}, // f =  149, e =   495
        {0xD17F3B51FCA3A7A0, 0xF75A15862CA504C6}, // f =  150, e =   499
        {0xA798FC4196E952E7, 0x2C48113823B73705}, // f =  151, e =   502
        {0x8613FD0145877585, 0xBD06742CE95F5F37}, // f =  152, e =   505
        {0xD686619BA27255A2, 0xC80A537B0EFEFEBE}, // f =  153, e =   509
        {0xAB9EB47C81F5114F, 0x066EA92F3F326565}, // f =  154, e =   512
        {0x894BC396CE5DA772, 0x6B8BBA8C328EB784}, // f =  155, e =   515
        {0xDBAC6C247D62A583, 0xDF45F746B74ABF3A}, // f =  156, e =   519
        {0xAFBD2350644EEACF, 0xE5D1929EF90898FB}, // f =  157, e =   522
        {0x8C974F7383725573, 0x1E414218C73A13FC}, // f =  158, e =   525
        {0xE0F218B8D25088B8, 0x306869C13EC3532D}, // f =  159, e =   529
        {0xB3F4E093DB73A093, 0x59ED216765690F57}, // f =  160, e =   532
        {0x8FF71A0FE2C2E6DC, 0x47F0E785EABA72AC}, // f =  161, e =   535
        {0xE65829B3046B0AFA, 0x0CB4A5A3112A5113}, // f =  162, e =   539
        {0xB84687C269EF3BFB, 0x3D5D514F40EEA743}, // f =  163, e =   542
        {0x936B9FCEBB25C995, 0xCAB10DD900BEEC35}, // f =  164, e =   545
        {0xEBDF661791D60F56, 0x111B495B3464AD22}, // f =  165, e =   549
        {0xBCB2B812DB11A5DE, 0x7415D448F6B6F0E8}, // f =  166, e =   552
        {0x96F5600F15A7B7E5, 0x29AB103A5EF8C0BA}, // f =  167, e =   555
        {0xF18899B1BC3F8CA1, 0xDC44E6C3CB279AC2}, // f =  168, e =   559
        {0xC13A148E3032D6E7, 0xE36A52363C1FAF02}, // f =  169, e =   562
        {0x9A94DD3E8CF578B9, 0x82BB74F8301958CF}, // f =  170, e =   565
        {0xF7549530E188C128, 0xD12BEE59E68EF47D}, // f =  171, e =   569
        {0xC5DD44271AD3CDBA, 0x40EFF1E1853F29FE}, // f =  172, e =   572
        {0x9E4A9CEC15763E2E, 0x9A598E4E043287FF}, // f =  173, e =   575
        {0xFD442E4688BD304A, 0x908F4A166D1DA664}, // f =  174, e =   579
        {0xCA9CF1D206FDC03B, 0xA6D90811F0E4851D}, // f =  175, e =   582
        {0xA21727DB38CB002F, 0xB8ADA00E5A506A7D}, // f =  176, e =   585
        {0x81AC1FE293D599BF, 0xC6F14CD848405531}, // f =  177, e =   588
        {0xCF79CC9DB955C2CC, 0x7182148D4066EEB5}, // f =  178, e =   592
        {0xA5FB0A17C777CF09, 0xF468107100525891}, // f =  179, e =   595
        {0x84C8D4DFD2C63F3B, 0x29ECD9F40041E074}, // f =  180, e =   598
        {0xD47487CC8470652B, 0x7647C32000696720}, // f =  181, e =   602
        {0xA9F6D30A038D1DBC, 0x5E9FCF4CCD211F4D}, // f =  182, e =   605
        {0x87F8A8D4CFA417C9, 0xE54CA5D70A80E5D7}, // f =  183, e =   608
        {0xD98DDAEE19068C76, 0x3BADD624DD9B0958}, // f =  184, e =   612
        {0xAE0B158B4738705E, 0x9624AB50B148D446}, // f =  185, e =   615
        {0x8B3C113C38F9F37E, 0xDE83BC408DD3DD05}, // f =  186, e =   618
        {0xDEC681F9F4C31F31, 0x6405FA00E2EC94D5}, // f =  187, e =   622
        {0xB23867FB2A35B28D, 0xE99E619A4F23AA44}, // f =  188, e =   625
        {0x8E938662882AF53E, 0x547EB47B7282EE9D}, // f =  189, e =   628
        {0xE41F3D6A7377EECA, 0x20CABA5F1D9E4A94}, // f =  190, e =   632
        {0xB67F6455292CBF08, 0x1A3BC84C17B1D543}, // f =  191, e =   635
        {0x91FF83775423CC06, 0x7B6306A34627DDD0}, // f =  192, e =   638
        {0xE998D258869FACD7, 0x2BD1A438703FC94C}, // f =  193, e =   642
        {0xBAE0A846D2195712, 0x8974836059CCA10A}, // f =  194, e =   645
        {0x9580869F0E7AAC0E, 0xD45D35E6AE3D4DA1}, // f =  195, e =   648
        {0xEF340A98172AACE4, 0x86FB897116C87C35}, // f =  196, e =   652
        {0xBF5CD54678EEF0B6, 0xD262D45A78A0635E}, // f =  197, e =   655
        {0x991711052D8BF3C5, 0x751BDD152D4D1C4B}, // f =  198, e =   658
        {0xF4F1B4D515ACB93B, 0xEE92FB5515482D45}, // f =  199, e =   662
        {0xC3F490AA77BD60FC, 0xBEDBFC4411068A9D}, // f =  200, e =   665
        {0x9CC3A6EEC6311A63, 0xCBE3303674053BB1}, // f =  201, e =   668
        {0xFAD2A4B13D1B5D6C, 0x796B805720085F82}, // f =  202, e =   672
        {0xC8A883C0FDAF7DF0, 0x6122CD128006B2CE}, // f =  203, e =   675
        {0xA086CFCD97BF97F3, 0x80E8A40ECCD228A5}, // f =  204, e =   678
        {0x806BD9714632DFF6, 0x00BA1CD8A3DB53B7}, // f =  205, e =   681
        {0xCD795BE870516656, 0x67902E276C921F8C}, // f =  206, e =   685
        {0xA46116538D0DEB78, 0x52D9BE85F074E609}, // f =  207, e =   688
        {0x8380DEA93DA4BC60, 0x4247CB9E59F71E6E}, // f =  208, e =   691
        {0xD267CAA862A12D66, 0xD072DF63C324FD7C}, // f =  209, e =   695
        {0xA8530886B54DBDEB, 0xD9F57F830283FDFD}, // f =  210, e =   698
        {0x86A8D39EF77164BC, 0xAE5DFF9C02033198}, // f =  211, e =   701
        {0xD77485CB25823AC7, 0x7D633293366B828C}, // f =  212, e =   705
        {0xAC5D37D5B79B6239, 0x311C2875C522CED6}, // f =  213, e =   708
        {0x89E42CAAF9491B60, 0xF41686C49DB57245}, // f =  214, e =   711
        {0xDCA04777F541C567, 0xECF0D7A0FC5583A1}, // f =  215, e =   715
        {0xB080392CC4349DEC, 0xBD8D794D96AACFB4}, // f =  216, e =   718
        {0x8D3360F09CF6E4BD, 0x64712DD7ABBBD95D}, // f =  217, e =   721
        {0xE1EBCE4DC7F16DFB, 0xD3E8495912C62895}, // f =  218, e =   725
        {0xB4BCA50B065ABE63, 0x0FED077A756B53AA}, // f =  219, e =   728
        {0x9096EA6F3848984F, 0x3FF0D2C85DEF7622}, // f =  220, e =   731
        {0xE757DD7EC07426E5, 0x331AEADA2FE589D0}, // f =  221, e =   735
        {0xB913179899F68584, 0x28E2557B59846E40}, // f =  222, e =   738
        {0x940F4613AE5ED136, 0x871B7795E136BE9A}, // f =  223, e =   741
        {0xECE53CEC4A314EBD, 0xA4F8BF5635246429}, // f =  224, e =   745
        {0xBD8430BD08277231, 0x50C6FF782A838354}, // f =  225, e =   748
        {0x979CF3CA6CEC5B5A, 0xA705992CEECF9C43}, // f =  226, e =   751
        {0xF294B943E17A2BC4, 0x3E6F5B7B17B2939E}, // f =  227, e =   755
        {0xC21094364DFB5636, 0x985915FC12F542E5}, // f =  228, e =   758
        {0x9B407691D7FC44F8, 0x79E0DE63425DCF1E}, // f =  229, e =   761
        {0xF867241C8CC6D4C0, 0xC30163D203C94B63}, // f =  230, e =   765
        {0xC6B8E9B0709F109A, 0x359AB6419CA1091C}, // f =  231, e =   768
        {0x9EFA548D26E5A6E1, 0xC47BC5014A1A6DB0}, // f =  232, e =   771
        {0xFE5D54150B090B02, 0xD3F93B35435D7C4D}, // f =  233, e =   775
        {0xCB7DDCDDA26DA268, 0xA9942F5DCF7DFD0A}, // f =  234, e =   778
        {0xA2CB1717B52481ED, 0x54768C4B0C64CA6F}, // f =  235, e =   781
        {0x823C12795DB6CE57, 0x76C53D08D6B70859}, // f =  236, e =   784
        {0xD0601D8EFC57B08B, 0xF13B94DAF124DA27}, // f =  237, e =   788
        {0xA6B34AD8C9DFC06F, 0xF42FAA48C0EA481F}, // f =  238, e =   791
        {0x855C3BE0A17FCD26, 0x5CF2EEA09A550680}, // f =  239, e =   794
        {0xD5605FCDCF32E1D6, 0xFB1E4A9A90880A65}, // f =  240, e =   798
        {0xAAB37FD7D8F58178, 0xC8E5087BA6D33B84}, // f =  241, e =   801
        {0x888F99797A5E012D, 0x6D8406C952429604}, // f =  242, e =   804
        {0xDA7F5BF590966848, 0xAF39A475506A899F}, // f =  243, e =   808
        {0xAECC49914078536D, 0x58FAE9F773886E19}, // f =  244, e =   811
        {0x8BD6A141006042BD, 0xE0C8BB2C5C6D24E1}, // f =  245, e =   814
        {0xDFBDCECE67006AC9, 0x67A791E093E1D49B}, // f =  246, e =   818
        {0xB2FE3F0B8599EF07, 0x861FA7E6DCB4AA16}, // f =  247, e =   821
        {0x8F31CC0937AE58D2, 0xD1B2ECB8B0908811}, // f =  248, e =   824
        {0xE51C79A85916F484, 0x82B7E12780E7401B}, // f =  249, e =   828
        {0xB749FAED14125D36, 0xCEF980EC671F667C}, // f =  250, e =   831
        {0x92A1958A7675175F, 0x0BFACD89EC191ECA}, // f =  251, e =   834
        {0xEA9C227723EE8BCB, 0x465E15A979C1CADD}, // f =  252, e =   838
        {0xBBB01B9283253CA2, 0x9EB1AAEDFB016F17}, // f =  253, e =   841
        {0x96267C7535B763B5, 0x4BC1558B2F3458DF}, // f =  254, e =   844
        {0xF03D93EEBC589F88, 0x793555AB7EBA27CB}, // f =  255, e =   848
        {0xC0314325637A1939, 0xFA911155FEFB5309}, // f =  256, e =   851
        {0x99C102844F94E0FB, 0x2EDA7444CBFC426E}, // f =  257, e =   854
        {0xF6019DA07F549B2B, 0x7E2A53A146606A49}, // f =  258, e =   858
        {0xC4CE17B399107C22, 0xCB550FB4384D21D4}, // f =  259, e =   861
        {0x9D71AC8FADA6C9B5, 0x6F773FC3603DB4AA}, // f =  260, e =   864
        {0xFBE9141915D7A922, 0x4BF1FF9F0062BAA9}, // f =  261, e =   868
        {0xC987434744AC874E, 0xA327FFB266B56221}, // f =  262, e =   871
        {0xA139029F6A239F72, 0x1C1FFFC1EBC44E81}, // f =  263, e =   874
        {0x80FA687F881C7F8E, 0x7CE66634BC9D0B9A}, // f =  264, e =   877
        {0xCE5D73FF402D98E3, 0xFB0A3D212DC81290}, // f =  265, e =   881
        {0xA5178FFF668AE0B6, 0x626E974DBE39A873}, // f =  266, e =   884
        {0x8412D9991ED58091, 0xE858790AFE9486C3}, // f =  267, e =   887
        {0xD3515C2831559A83, 0x0D5A5B44CA873E04}, // f =  268, e =   891
        {0xA90DE3535AAAE202, 0x711515D0A205CB37}, // f =  269, e =   894
        {0x873E4F75E2224E68, 0x5A7744A6E804A292}, // f =  270, e =   897
        {0xD863B256369D4A40, 0x90BED43E40076A83}, // f =  271, e =   901
        {0xAD1C8EAB5EE43B66, 0xDA3243650005EED0}, // f =  272, e =   904
        {0x8A7D3EEF7F1CFC52, 0x482835EA666B2573}, // f =  273, e =   907
        {0xDD95317F31C7FA1D, 0x40405643D711D584}, // f =  274, e =   911
        {0xB1442798F49FFB4A, 0x99CD11CFDF41779D}, // f =  275, e =   914
        {0x8DD01FAD907FFC3B, 0xAE3DA7D97F6792E4}, // f =  276, e =   917
        {0xE2E69915B3FFF9F9, 0x16C90C8F323F516D}, // f =  277, e =   921
        {0xB58547448FFFFB2D, 0xABD40A0C2832A78B}, // f =  278, e =   924
        {0x91376C36D99995BE, 0x23100809B9C21FA2}, // f =  279, e =   927
        {0xE858AD248F5C22C9, 0xD1B3400F8F9CFF69}, // f =  280, e =   931
        {0xB9E08A83A5E34F07, 0xDAF5CCD93FB0CC54}, // f =  281, e =   934
        {0x94B3A202EB1C3F39, 0x7BF7D71432F3D6AA}, // f =  282, e =   937
        {0xEDEC366B11C6CB8F, 0x2CBFBE86B7EC8AA9}, // f =  283, e =   941
        {0xBE5691EF416BD60C, 0x23CC986BC656D554}, // f =  284, e =   944
        {0x9845418C345644D6, 0x830A13896B78AAAA}, // f =  285, e =   947
        {0xF3A20279ED56D48A, 0x6B43527578C11110}, // f =  286, e =   951
        {0xC2E801FB244576D5, 0x229C41F793CDA740}, // f =  287, e =   954
        {0x9BECCE62836AC577, 0x4EE367F9430AEC33}, // f =  288, e =   957
        {0xF97AE3D0D2446F25, 0x4B0573286B44AD1E}, // f =  289, e =   961
        {0xC795830D75038C1D, 0xD59DF5B9EF6A2418}, // f =  290, e =   964
        {0x9FAACF3DF73609B1, 0x77B191618C54E9AD}, // f =  291, e =   967
        {0xFF77B1FCBEBCDC4F, 0x25E8E89C13BB0F7B}, // f =  292, e =   971
    };

    TEJU_ASSERT(f >= MinDecExp);
    TEJU_ASSERT(f <= MaxDecExp);
    return ScaledPow10[f - MinDecExp];
}

//==================================================================================================
// ComputeMultInverse
//==================================================================================================
// Constant data: 432 bytes

const MultInverse& teju::impl::ComputeMultInverse(int k)
{
    static constexpr MultInverse Inverses[MultInverseCount] = {
        {0x0000000000000001, 0xFFFFFFFFFFFFFFFF}, // 5^0
        {0xCCCCCCCCCCCCCCCD, 0x3333333333333333}, // 5^1
        {0x8F5C28F5C28F5C29, 0x0A3D70A3D70A3D70}, // 5^2
        {0x1CAC083126E978D5, 0x020C49BA5E353F7C}, // 5^3
        {0xD288CE703AFB7E91, 0x0068DB8BAC710CB2}, // 5^4
        {0x5D4E8FB00BCBE61D, 0x0014F8B588E368F0}, // 5^5
        {0x790FB65668C26139, 0x000431BDE82D7B63}, // 5^6
        {0xE5032477AE8D46A5, 0x0000D6BF94D5E57A}, // 5^7
        {0xC767074B22E90E21, 0x00002AF31DC46118}, // 5^8
        {0x8E47CE423A2E9C6D, 0x0000089705F4136B}, // 5^9
        {0x4FA7F60D3ED61F49, 0x000001B7CDFD9D7B}, // 5^10
        {0x0FEE64690C913975, 0x00000057F5FF85E5}, // 5^11
        {0x3662E0E1CF503EB1, 0x000000119799812D}, // 5^12
        {0xA47A2CF9F6433FBD, 0x0000000384B84D09}, // 5^13
        {0x54186F653140A659, 0x00000000B424DC35}, // 5^14
        {0x7738164770402145, 0x0000000024075F3D}, // 5^15
        {0xE4A4D1417CD9A041, 0x000000000734ACA5}, // 5^16
        {0xC75429D9E5C5200D, 0x000000000170EF54}, // 5^17
        {0xC1773B91FAC10669, 0x000000000049C977}, // 5^18
        {0x26B172506559CE15, 0x00000000000EC1E4}, // 5^19
        {0xD489E3A9ADDEC2D1, 0x000000000002F394}, // 5^20
        {0x90E860BB892C8D5D, 0x000000000000971D}, // 5^21
        {0x502E79BF1B6F4F79, 0x0000000000001E39}, // 5^22
        {0xDCD618596BE30FE5, 0x000000000000060B}, // 5^23
        {0x2C2AD1AB7BFA3661, 0x0000000000000135}, // 5^24
        {0x08D55D224BFED7AD, 0x000000000000003D}, // 5^25
        {0x01C445D3A8CC9189, 0x000000000000000C}, // 5^26
    };

    TEJU_ASSERT(k >= 0);
    TEJU_ASSERT(k < MultInverseCount);
    return Inverses[k];
}
